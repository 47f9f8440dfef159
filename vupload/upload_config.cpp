#include <cstdlib>
#include <fstream>

#include "upload_config.hpp"
#include "misc.hpp"

// submodules
#include "spdlog/spdlog.h"

using namespace std;

namespace vupload
{

#define LOG_SC_CONFIG "CONFIG "

namespace
{

string unquote(const string& value)
{
	// A quoted value ends at its closing quote, anything after it is a comment.
	if (!value.empty() && (value.front() == '"' || value.front() == '\''))
	{
		const size_t closing = value.find(value.front(), 1);
		if (closing != string::npos)
			return value.substr(1, closing - 1);
	}

	// Unquoted values may carry a trailing comment.
	const size_t comment = value.find(" #");
	return comment == string::npos ? value : trim(value.substr(0, comment));
}

} // namespace

env_lookup_fn process_environment()
{
	return [](const string& name) -> optional<string> {
		const char* value = getenv(name.c_str());
		if (value == nullptr)
			return nullopt;
		return string(value);
	};
}

upload_config load_upload_config(const env_lookup_fn& lookup, bool create_destination_dir)
{
	upload_config cfg;
	cfg.api_key             = lookup(env::api_key).value_or("");
	cfg.bucket              = lookup(env::bucket).value_or("");
	cfg.service_instance_id = lookup(env::service_instance_id).value_or("");
	cfg.service_endpoint    = lookup(env::service_endpoint).value_or("");
	cfg.remote_host         = lookup(env::remote_host).value_or(default_remote_host);
	cfg.destination_prefix  = lookup(env::destination).value_or(default_destination);
	cfg.create_destination_dir = create_destination_dir;

	spdlog::debug(LOG_SC_CONFIG "remote host {}, destination '{}', create dir {}.",
		cfg.remote_host, cfg.destination_prefix, cfg.create_destination_dir);
	return cfg;
}

map<string, string> parse_env_file(istream& in)
{
	map<string, string> vars;
	string line;
	int    line_no = 0;

	while (getline(in, line))
	{
		++line_no;
		string entry = trim(line);
		if (entry.empty() || entry[0] == '#')
			continue;

		if (entry.compare(0, 7, "export ") == 0)
			entry = trim(entry.substr(7));

		const size_t eq = entry.find('=');
		if (eq == string::npos || eq == 0)
		{
			spdlog::warn(LOG_SC_CONFIG "Ignoring malformed line {} in env file.", line_no);
			continue;
		}

		vars[trim(entry.substr(0, eq))] = unquote(trim(entry.substr(eq + 1)));
	}

	return vars;
}

size_t load_env_file(const string& path)
{
	ifstream file(path);
	if (!file)
	{
		spdlog::debug(LOG_SC_CONFIG "No env file at '{}'.", path);
		return 0;
	}

	size_t num_set = 0;
	for (const auto& var : parse_env_file(file))
	{
		// Keep values given explicitly in the environment.
		if (getenv(var.first.c_str()) != nullptr)
			continue;

		if (setenv(var.first.c_str(), var.second.c_str(), 0) != 0)
		{
			spdlog::warn(LOG_SC_CONFIG "Failed to set {} from '{}'.", var.first, path);
			continue;
		}
		++num_set;
	}

	spdlog::debug(LOG_SC_CONFIG "Loaded {} variable(s) from '{}'.", num_set, path);
	return num_set;
}

} // namespace vupload
