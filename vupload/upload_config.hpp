#pragma once
#include <functional>
#include <istream>
#include <map>
#include <optional>
#include <string>

namespace vupload
{

/// Aspera transfer service shared node (Frankfurt).
constexpr const char* default_remote_host = "ats-sl-fra.aspera.io";
constexpr const char* default_destination = "/aspera-uploads";

/// Credentials and destination of an upload. Built once at startup.
struct upload_config
{
	std::string api_key;
	std::string bucket;
	std::string service_instance_id;
	std::string service_endpoint;
	std::string remote_host        = default_remote_host;
	std::string destination_prefix = default_destination;
	bool        create_destination_dir = true;
};

/// Environment variables the configuration is read from.
namespace env
{
constexpr const char* api_key             = "IBMCLOUD_API_KEY";
constexpr const char* bucket              = "IBMCLOUD_BUCKET";
constexpr const char* service_instance_id = "IBMCLOUD_COS_INSTANCE_ID";
constexpr const char* service_endpoint    = "IBMCLOUD_COS_ENDPOINT";
constexpr const char* remote_host         = "ASPERA_REMOTE_HOST";
constexpr const char* destination         = "COS_DESTINATION";
} // namespace env

/// Returns the value of a variable, or std::nullopt if it is not set.
typedef std::function<std::optional<std::string>(const std::string& name)> env_lookup_fn;

/// Lookup in the environment of the process.
env_lookup_fn process_environment();

/// @brief Build the upload configuration.
/// Unset optional variables get their defaults. Required fields are not checked here.
/// @param lookup                  variable source
/// @param create_destination_dir  let the daemon create the destination prefix
upload_config load_upload_config(const env_lookup_fn& lookup, bool create_destination_dir);

/// @brief Parse KEY=VALUE lines of a dotenv file.
/// Blank lines and '#' comments are skipped, an "export " prefix is allowed,
/// matching single or double quotes around a value are removed.
std::map<std::string, std::string> parse_env_file(std::istream& in);

/// @brief Load a dotenv file into the process environment.
/// Variables already set in the environment are not overridden.
/// @return the number of variables set, 0 if the file does not exist
size_t load_env_file(const std::string& path);

} // namespace vupload
