#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

// vupload
#include "rpc_client.hpp"
#include "transfer_state.hpp"

namespace vupload
{
namespace monitor
{

/// How monitoring of a transfer ended.
struct outcome
{
	transfer_status status;              // completed, failed, timed_out or the last state seen
	std::string     transfer_id;
	int64_t         bytes_transferred = 0;
	int64_t         elapsed_seconds   = 0;
	size_t          num_samples       = 0;
	bool            interrupted       = false; // Stopped by an interrupt request
};

/// Follows the status updates of one transfer until it completes, fails,
/// or the watchdog gives up.
///
/// The watchdog is evaluated on every received sample only. If the daemon
/// stops sending updates, run() keeps waiting on the stream.
/// A timeout does not cancel the transfer on the daemon.
class progress_monitor
{
public:
	typedef std::function<std::chrono::steady_clock::time_point()> clock_fn;

	static constexpr std::chrono::seconds default_watchdog{300};

	/// The elapsed time is counted from construction. Create right after the submission.
	/// @param total_size_bytes  size of all submitted assets, used in progress reports
	explicit progress_monitor(int64_t total_size_bytes,
		const std::chrono::seconds& watchdog = default_watchdog,
		clock_fn clock = std::chrono::steady_clock::now);

public:
	/// @brief Account one sample. Sets the elapsed time of the sample.
	/// @return true if monitoring must stop
	bool on_sample(progress_sample& sample);

	/// @brief Consume the stream until a terminal state, the watchdog or an interrupt.
	/// @throws monitoring_error if the stream failed or ended before a terminal state
	outcome run(rpc::isample_stream& stream, const std::atomic_bool& force_break);

	const outcome& result() const { return m_outcome; }

private:
	const int64_t                               m_total_size_bytes;
	const std::chrono::seconds                  m_watchdog;
	clock_fn                                    m_clock;
	const std::chrono::steady_clock::time_point m_start;
	outcome                                     m_outcome;
};

/// "[12s] Transfer <id>: Running - 1.5 MB of 10.0 MB"
std::string format_progress(const progress_sample& sample, int64_t total_size_bytes);

} // namespace monitor
} // namespace vupload
