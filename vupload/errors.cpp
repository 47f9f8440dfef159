#include "errors.hpp"

using namespace std;

namespace vupload
{

namespace
{

string missing_fields_message(const vector<string>& missing)
{
	string msg = "Missing environment variables:";
	for (const string& name : missing)
	{
		msg += " ";
		msg += name;
	}
	return msg;
}

} // namespace

configuration_error::configuration_error(const vector<string>& missing)
	: exception(missing_fields_message(missing))
	, m_missing(missing)
{
}

vector<string> hint_for(const string& daemon_message)
{
	// transferd reports this when destination_root names an object rather than a prefix.
	if (daemon_message.find("Destination path is not a directory") != string::npos)
	{
		return {
			"Hint: Set COS_DESTINATION to a directory prefix (e.g. '/', '/Upload/', or '/my-prefix/').",
			"The destination must end with a trailing slash to be treated as a folder/prefix."
		};
	}

	return {};
}

} // namespace vupload
