#pragma once
#include <cstdint>
#include <string>

namespace vupload
{

enum class transfer_state
{
	submitted,
	queued,
	running,
	completed,
	failed,
	paused,
	timed_out,
	unknown, // Status code outside of the known set, see transfer_status::code
};

/// Transfer state together with the raw daemon status code it was mapped from.
struct transfer_status
{
	transfer_state state = transfer_state::submitted;
	int            code  = -1;
};

/// @brief Map a raw daemon status code to a transfer status.
/// Codes without a dedicated state map to transfer_state::unknown.
transfer_status map_status_code(int code);

/// Completed, Failed and TimedOut are terminal.
bool is_terminal(transfer_state state);

/// Human readable name, e.g. "Running" or "Unknown (4)".
std::string to_string(const transfer_status& status);

/// One status update of a monitored transfer.
struct progress_sample
{
	std::string     transfer_id;
	transfer_status status;
	int64_t         bytes_transferred = 0; // 0 if the update carried no transfer info
	int64_t         elapsed_seconds   = 0; // Since submission, filled by the monitor
};

} // namespace vupload
