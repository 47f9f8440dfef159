#include <atomic>

#include "rpc_client.hpp"
#include "errors.hpp"

// submodules
#include "spdlog/spdlog.h"

using namespace std;
using namespace std::chrono;
namespace api = transferd::api;

namespace vupload
{
namespace rpc
{

#define LOG_SC_RPC "RPC "

namespace
{

class grpc_sample_stream final : public isample_stream
{
public:
	grpc_sample_stream(api::TransferService::Stub& stub, const string& transfer_id)
		: m_transfer_id(transfer_id)
	{
		// One filter with one id: updates of other transfers on the daemon are not received.
		api::RegistrationFilter* filter = m_registration.add_filters();
		filter->add_transferid(transfer_id);

		m_reader = stub.MonitorTransfers(&m_context, m_registration);
		if (!m_reader)
			throw monitoring_error(fmt::format("Failed to subscribe to transfer {}", transfer_id));
	}

	~grpc_sample_stream() override
	{
		if (m_finished)
			return;

		// A reader must be finished before it is destroyed.
		m_context.TryCancel();
		const grpc::Status status = m_reader->Finish();
		spdlog::trace(LOG_SC_RPC "Monitor stream of {} closed: {}.", m_transfer_id, status.error_message());
	}

public:
	bool read(progress_sample& sample) final
	{
		if (m_finished)
			return false;

		api::TransferResponse response;
		if (m_reader->Read(&response))
		{
			sample                   = progress_sample();
			sample.transfer_id       = response.transferid();
			sample.status            = map_status_code(response.status());
			sample.bytes_transferred = response.has_transferinfo() ? response.transferinfo().bytestransferred() : 0;
			return true;
		}

		m_finished = true;
		const grpc::Status status = m_reader->Finish();
		if (status.ok())
			return false;

		if (m_cancelled && status.error_code() == grpc::StatusCode::CANCELLED)
		{
			spdlog::debug(LOG_SC_RPC "Monitor stream of {} cancelled.", m_transfer_id);
			return false;
		}

		throw monitoring_error(status.error_message());
	}

	void cancel() final
	{
		m_cancelled = true;
		m_context.TryCancel();
	}

private:
	const string                                            m_transfer_id;
	grpc::ClientContext                                     m_context;
	api::RegistrationRequest                                m_registration;
	unique_ptr<grpc::ClientReader<api::TransferResponse>>   m_reader;
	atomic_bool                                             m_cancelled{false};
	bool                                                    m_finished = false;
};

} // namespace

grpc_client::grpc_client(const string& address, const seconds& connect_timeout)
	: m_address(address)
{
	m_channel = grpc::CreateChannel(address, grpc::InsecureChannelCredentials());
	if (!m_channel)
		throw connection_error(fmt::format("Could not create a channel to {}", address));

	spdlog::debug(LOG_SC_RPC "Waiting up to {} s for {} to get ready.", connect_timeout.count(), address);
	if (!m_channel->WaitForConnected(system_clock::now() + connect_timeout))
	{
		throw connection_error(fmt::format(
			"Could not connect to the transfer daemon at {} (is transferd running?)", address));
	}

	m_stub = api::TransferService::NewStub(m_channel);
}

string grpc_client::start_transfer(const string& transfer_spec)
{
	api::TransferRequest request;
	request.set_transfertype(api::FILE_REGULAR);
	request.mutable_config(); // daemon defaults
	request.set_transferspec(transfer_spec);

	grpc::ClientContext        context;
	api::StartTransferResponse response;
	const grpc::Status status = m_stub->StartTransfer(&context, request, &response);
	if (!status.ok())
		throw submission_error(status.error_message());

	spdlog::trace(LOG_SC_RPC "StartTransfer on {} returned id {}.", m_address, response.transferid());
	return response.transferid();
}

unique_ptr<isample_stream> grpc_client::monitor_transfers(const string& transfer_id)
{
	return unique_ptr<isample_stream>(new grpc_sample_stream(*m_stub, transfer_id));
}

unique_ptr<itransfer_client> make_grpc_client(const string& address, const seconds& connect_timeout)
{
	return unique_ptr<itransfer_client>(new grpc_client(address, connect_timeout));
}

} // namespace rpc
} // namespace vupload
