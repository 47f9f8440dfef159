#include <vector>

#include "transfer_session.hpp"
#include "errors.hpp"

// submodules
#include "spdlog/spdlog.h"

using namespace std;

namespace vupload
{
namespace session
{

#define LOG_SC_SESSION "SESSION "

transfer_session::transfer_session(const string& daemon_address, const chrono::seconds& connect_timeout,
	client_factory factory)
	: m_address(daemon_address)
	, m_connect_timeout(connect_timeout)
	, m_factory(std::move(factory))
{
}

void transfer_session::connect()
{
	if (m_client)
		return;

	m_client = m_factory(m_address, m_connect_timeout);
	if (!m_client)
		throw connection_error(fmt::format("Could not connect to the transfer daemon at {}", m_address));

	spdlog::info(LOG_SC_SESSION "Connected to Transfer Manager at {}.", m_address);
}

void transfer_session::validate_for_submission(const upload_config& cfg)
{
	const pair<const char*, const string*> required[] = {
		{ env::api_key, &cfg.api_key },
		{ env::bucket, &cfg.bucket },
		{ env::service_instance_id, &cfg.service_instance_id },
		{ env::service_endpoint, &cfg.service_endpoint },
	};

	vector<string> missing;
	for (const auto& field : required)
	{
		if (field.second->empty())
			missing.emplace_back(field.first);
	}

	if (!missing.empty())
		throw configuration_error(missing);

	spdlog::info(LOG_SC_SESSION "Environment loaded successfully.");
}

string transfer_session::submit(const request::transfer_request& req)
{
	connect();

	spdlog::debug(LOG_SC_SESSION "Submitting {} asset(s) to '{}'.", req.assets().size(), req.destination_root());
	const string transfer_id = m_client->start_transfer(req.to_string(false));
	if (transfer_id.empty())
		throw submission_error("The daemon returned an empty transfer id");

	return transfer_id;
}

unique_ptr<rpc::isample_stream> transfer_session::monitor(const string& transfer_id)
{
	connect();

	unique_ptr<rpc::isample_stream> stream = m_client->monitor_transfers(transfer_id);
	if (!stream)
		throw monitoring_error(fmt::format("Failed to subscribe to transfer {}", transfer_id));

	spdlog::debug(LOG_SC_SESSION "Monitoring transfer {}.", transfer_id);
	return stream;
}

} // namespace session
} // namespace vupload
