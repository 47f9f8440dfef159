#pragma once
#include <chrono>
#include <memory>
#include <string>

// Third party libraries
#include <grpcpp/grpcpp.h>

// generated
#include "transferd.grpc.pb.h"

// vupload
#include "transfer_state.hpp"

namespace vupload
{
namespace rpc
{

/// Status updates of one transfer, pulled one at a time.
class isample_stream
{
public:
	virtual ~isample_stream() = default;

public:
	/** Block until the daemon emits the next status update.
	 *
	 * @returns true if a sample was read, false if the stream ended
	 * normally or was cancelled.
	 *
	 * @throws monitoring_error Thrown if the stream failed.
	 */
	virtual bool read(progress_sample& sample) = 0;

	/// Unblock a pending read(). Safe to call from another thread.
	/// Only the local subscription is cancelled, never the transfer.
	virtual void cancel() = 0;
};

/// The transfer daemon (transferd) RPC boundary.
class itransfer_client
{
public:
	virtual ~itransfer_client() = default;

public:
	/** Start a regular file transfer.
	 *
	 * @param transfer_spec JSON transfer specification.
	 *
	 * @returns The daemon-assigned transfer identifier.
	 *
	 * @throws submission_error Thrown if the daemon rejected the request.
	 */
	virtual std::string start_transfer(const std::string& transfer_spec) = 0;

	/** Subscribe to status updates of a single transfer.
	 *
	 * @throws monitoring_error Thrown if the subscription failed.
	 */
	virtual std::unique_ptr<isample_stream> monitor_transfers(const std::string& transfer_id) = 0;
};

/// Transfer daemon client over an insecure gRPC channel (the daemon runs locally).
class grpc_client final : public itransfer_client
{
public:
	/// @throws connection_error if the channel does not get ready within connect_timeout
	grpc_client(const std::string& address, const std::chrono::seconds& connect_timeout);

public:
	std::string                     start_transfer(const std::string& transfer_spec) final;
	std::unique_ptr<isample_stream> monitor_transfers(const std::string& transfer_id) final;

private:
	const std::string                                       m_address;
	std::shared_ptr<grpc::Channel>                          m_channel;
	std::unique_ptr<transferd::api::TransferService::Stub> m_stub;
};

std::unique_ptr<itransfer_client> make_grpc_client(const std::string& address,
	const std::chrono::seconds& connect_timeout);

} // namespace rpc
} // namespace vupload
