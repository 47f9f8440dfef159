#include "transfer_state.hpp"

// generated
#include "transferd.pb.h"

namespace api = transferd::api;

namespace vupload
{

transfer_status map_status_code(int code)
{
	transfer_status result;
	result.code = code;

	switch (code)
	{
	case api::QUEUED:
		result.state = transfer_state::queued;
		break;
	case api::RUNNING:
		result.state = transfer_state::running;
		break;
	case api::COMPLETED:
		result.state = transfer_state::completed;
		break;
	case api::FAILED:
		result.state = transfer_state::failed;
		break;
	case api::PAUSED:
		result.state = transfer_state::paused;
		break;
	default:
		result.state = transfer_state::unknown;
		break;
	}

	return result;
}

bool is_terminal(transfer_state state)
{
	return state == transfer_state::completed
		|| state == transfer_state::failed
		|| state == transfer_state::timed_out;
}

std::string to_string(const transfer_status& status)
{
	switch (status.state)
	{
	case transfer_state::submitted:
		return "Submitted";
	case transfer_state::queued:
		return "Queued";
	case transfer_state::running:
		return "Running";
	case transfer_state::completed:
		return "Completed";
	case transfer_state::failed:
		return "Failed";
	case transfer_state::paused:
		return "Paused";
	case transfer_state::timed_out:
		return "TimedOut";
	case transfer_state::unknown:
		break;
	}

	return "Unknown (" + std::to_string(status.code) + ")";
}

} // namespace vupload
