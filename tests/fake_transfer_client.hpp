#pragma once
#include <deque>
#include <memory>
#include <string>
#include <vector>

#include "errors.hpp"
#include "rpc_client.hpp"

namespace vupload
{
namespace test
{

/// Replays a fixed list of samples.
class scripted_stream : public rpc::isample_stream
{
public:
	explicit scripted_stream(std::deque<progress_sample> samples, std::string failure = std::string())
		: m_samples(std::move(samples))
		, m_failure(std::move(failure))
	{
	}

	bool read(progress_sample& sample) override
	{
		if (m_samples.empty())
		{
			if (!m_failure.empty())
				throw monitoring_error(m_failure);
			return false;
		}

		sample = m_samples.front();
		m_samples.pop_front();
		++m_num_read;
		return true;
	}

	void cancel() override { m_cancelled = true; }

	size_t num_read() const { return m_num_read; }
	bool   cancelled() const { return m_cancelled; }

private:
	std::deque<progress_sample> m_samples;
	std::string                 m_failure;
	size_t                      m_num_read  = 0;
	bool                        m_cancelled = false;
};

/// What the fake daemon received.
struct daemon_log
{
	std::vector<std::string> submitted_specs;
	std::vector<std::string> monitored_ids;
	int                      num_connects = 0;
};

class fake_transfer_client : public rpc::itransfer_client
{
public:
	fake_transfer_client(daemon_log& log, std::deque<progress_sample> samples, std::string reject_message)
		: m_log(log)
		, m_samples(std::move(samples))
		, m_reject_message(std::move(reject_message))
	{
	}

	std::string start_transfer(const std::string& transfer_spec) override
	{
		m_log.submitted_specs.push_back(transfer_spec);
		if (!m_reject_message.empty())
			throw submission_error(m_reject_message);
		return "transfer-1";
	}

	std::unique_ptr<rpc::isample_stream> monitor_transfers(const std::string& transfer_id) override
	{
		m_log.monitored_ids.push_back(transfer_id);
		return std::unique_ptr<rpc::isample_stream>(new scripted_stream(m_samples));
	}

private:
	daemon_log&                 m_log;
	std::deque<progress_sample> m_samples;
	std::string                 m_reject_message;
};

inline progress_sample make_sample(int status_code, int64_t bytes, const std::string& id = "transfer-1")
{
	progress_sample sample;
	sample.transfer_id       = id;
	sample.status            = map_status_code(status_code);
	sample.bytes_transferred = bytes;
	return sample;
}

} // namespace test
} // namespace vupload
