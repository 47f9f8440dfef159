#include "progress_monitor.hpp"
#include "errors.hpp"
#include "misc.hpp"

// submodules
#include "spdlog/spdlog.h"

using namespace std;
using namespace std::chrono;

namespace vupload
{
namespace monitor
{

#define LOG_SC_MONITOR "MONITOR "

progress_monitor::progress_monitor(int64_t total_size_bytes, const seconds& watchdog, clock_fn clock)
	: m_total_size_bytes(total_size_bytes)
	, m_watchdog(watchdog)
	, m_clock(std::move(clock))
	, m_start(m_clock())
{
}

bool progress_monitor::on_sample(progress_sample& sample)
{
	sample.elapsed_seconds = duration_cast<seconds>(m_clock() - m_start).count();

	++m_outcome.num_samples;
	m_outcome.status            = sample.status;
	m_outcome.transfer_id       = sample.transfer_id;
	m_outcome.bytes_transferred = sample.bytes_transferred;
	m_outcome.elapsed_seconds   = sample.elapsed_seconds;

	spdlog::info(format_progress(sample, m_total_size_bytes));

	if (is_terminal(sample.status.state))
		return true;

	if (sample.elapsed_seconds > m_watchdog.count())
	{
		m_outcome.status.state = transfer_state::timed_out;
		return true;
	}

	return false;
}

outcome progress_monitor::run(rpc::isample_stream& stream, const atomic_bool& force_break)
{
	progress_sample sample;

	while (!force_break)
	{
		if (!stream.read(sample))
		{
			if (force_break)
				break;

			throw monitoring_error("Status stream closed before the transfer reached a terminal state");
		}

		if (on_sample(sample))
			return m_outcome;
	}

	spdlog::info(LOG_SC_MONITOR "interrupted by request!");
	m_outcome.interrupted = true;
	return m_outcome;
}

string format_progress(const progress_sample& sample, int64_t total_size_bytes)
{
	return fmt::format("[{}s] Transfer {}: {} - {:.1f} MB of {:.1f} MB",
		sample.elapsed_seconds, sample.transfer_id, to_string(sample.status),
		to_megabytes(sample.bytes_transferred), to_megabytes(total_size_bytes));
}

} // namespace monitor
} // namespace vupload
