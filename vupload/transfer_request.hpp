#pragma once
#include <cstdint>
#include <string>
#include <vector>

// Third party libraries
#include <json/json.h>

// vupload
#include "file_discovery.hpp"
#include "upload_config.hpp"

namespace vupload
{
namespace request
{

/// Prepend "https://" to a non-empty endpoint without an http(s) scheme.
std::string normalize_endpoint(const std::string& endpoint);

/// Trim whitespace and wrap in slashes: "uploads" -> "/uploads/", "" -> "/".
std::string normalize_destination(const std::string& destination);

/// Transfer specification (TransferSpecV2) of a bulk upload to a COS bucket.
/// Immutable: changes produce a new request.
class transfer_request
{
public:
	/// Normalizes the endpoint and the destination prefix of the config.
	transfer_request(const upload_config& cfg, std::vector<source_asset> assets);

public:
	const upload_config&             config() const { return m_config; }
	const std::vector<source_asset>& assets() const { return m_assets; }
	const std::string&               endpoint() const { return m_config.service_endpoint; }
	const std::string&               destination_root() const { return m_config.destination_prefix; }

	/// Sum of known asset sizes.
	int64_t total_size_bytes() const;

	/// A copy of this request uploading to another destination prefix.
	transfer_request with_destination(const std::string& destination) const;

public:
	Json::Value to_json() const;

	/// @param styled  indented output for humans, otherwise compact
	std::string to_string(bool styled) const;

private:
	upload_config             m_config;
	std::vector<source_asset> m_assets;
};

/// Build a transfer request. Performs no I/O.
transfer_request build(const upload_config& cfg, const std::vector<source_asset>& assets);

} // namespace request
} // namespace vupload
