#pragma once
#include <chrono>
#include <functional>
#include <memory>
#include <string>

// vupload
#include "rpc_client.hpp"
#include "transfer_request.hpp"
#include "upload_config.hpp"

namespace vupload
{
namespace session
{

/// Connection to the transfer daemon and the lifecycle of one transfer:
/// connect, submit, monitor.
class transfer_session
{
public:
	typedef std::function<std::unique_ptr<rpc::itransfer_client>(
		const std::string& address, const std::chrono::seconds& connect_timeout)>
		client_factory;

	transfer_session(const std::string& daemon_address, const std::chrono::seconds& connect_timeout,
		client_factory factory = rpc::make_grpc_client);

public:
	/// Create the RPC client if not created yet.
	/// @throws connection_error if the daemon is not reachable
	void connect();

	bool is_connected() const { return !!m_client; }

	/// @brief Check the fields required by a real submission.
	/// @throws configuration_error listing every missing field
	static void validate_for_submission(const upload_config& cfg);

	/// @brief Submit the request to the daemon. Connects if needed.
	/// @return daemon-assigned transfer id
	/// @throws submission_error with the daemon message
	std::string submit(const request::transfer_request& req);

	/// @brief Subscribe to status updates of the transfer.
	/// The stream can't be restarted once it ended.
	std::unique_ptr<rpc::isample_stream> monitor(const std::string& transfer_id);

private:
	const std::string                      m_address;
	const std::chrono::seconds             m_connect_timeout;
	client_factory                         m_factory;
	std::unique_ptr<rpc::itransfer_client> m_client;
};

} // namespace session
} // namespace vupload
