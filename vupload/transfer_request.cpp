#include "transfer_request.hpp"
#include "misc.hpp"

using namespace std;

namespace vupload
{
namespace request
{

string normalize_endpoint(const string& endpoint)
{
	if (endpoint.empty())
		return endpoint;

	if (starts_with(endpoint, "http://") || starts_with(endpoint, "https://"))
		return endpoint;

	return "https://" + endpoint;
}

string normalize_destination(const string& destination)
{
	string root = trim(destination);
	if (root.empty() || root[0] != '/')
		root.insert(0, "/");
	if (root.back() != '/')
		root.push_back('/');
	return root;
}

transfer_request::transfer_request(const upload_config& cfg, vector<source_asset> assets)
	: m_config(cfg)
	, m_assets(std::move(assets))
{
	m_config.service_endpoint   = normalize_endpoint(cfg.service_endpoint);
	m_config.destination_prefix = normalize_destination(cfg.destination_prefix);
}

int64_t transfer_request::total_size_bytes() const
{
	int64_t total = 0;
	for (const source_asset& asset : m_assets)
	{
		if (asset.size_bytes > 0)
			total += asset.size_bytes;
	}
	return total;
}

transfer_request transfer_request::with_destination(const string& destination) const
{
	upload_config cfg = m_config;
	cfg.destination_prefix = destination;
	return transfer_request(cfg, m_assets);
}

Json::Value transfer_request::to_json() const
{
	Json::Value icos(Json::objectValue);
	icos["api_key"]                 = m_config.api_key;
	icos["bucket"]                  = m_config.bucket;
	icos["ibm_service_instance_id"] = m_config.service_instance_id;
	icos["ibm_service_endpoint"]    = m_config.service_endpoint;

	Json::Value paths(Json::arrayValue);
	for (const source_asset& asset : m_assets)
	{
		// Without "destination" the daemon keeps the original filename.
		Json::Value entry(Json::objectValue);
		entry["source"] = asset.absolute_path;
		if (asset.destination)
			entry["destination"] = *asset.destination;
		paths.append(entry);
	}

	Json::Value spec(Json::objectValue);
	spec["session_initiation"]["icos"]   = icos;
	spec["file_system"]["create_dir"]    = m_config.create_destination_dir;
	spec["direction"]                    = "send";
	spec["remote_host"]                  = m_config.remote_host;
	spec["title"]                        = "video file upload";
	spec["assets"]["destination_root"]   = m_config.destination_prefix;
	spec["assets"]["paths"]              = paths;
	return spec;
}

string transfer_request::to_string(bool styled) const
{
	Json::StreamWriterBuilder builder;
	builder["indentation"] = styled ? "  " : "";
	builder["emitUTF8"]    = true;
	return Json::writeString(builder, to_json());
}

transfer_request build(const upload_config& cfg, const vector<source_asset>& assets)
{
	return transfer_request(cfg, assets);
}

} // namespace request
} // namespace vupload
