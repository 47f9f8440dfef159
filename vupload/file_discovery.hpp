#pragma once
#include <cstdint>
#include <filesystem> // Requires C++17
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace vupload
{

/// A local file selected for upload.
struct source_asset
{
	std::string                absolute_path;
	int64_t                    size_bytes = -1; // -1 if the size could not be read
	std::optional<std::string> destination;     // Remote name. The original filename is kept if not set.
};

namespace discovery
{

/// A set of file suffixes matched case-insensitively, e.g. ".mp4".
class extension_set
{
public:
	extension_set(std::initializer_list<std::string> suffixes);
	explicit extension_set(const std::vector<std::string>& suffixes);

	/// .mp4 and .mov
	static extension_set videos();

public:
	/// Add a suffix. A missing leading dot is added ("mkv" -> ".mkv").
	void add(const std::string& suffix);

	bool matches(const std::filesystem::path& path) const;

	const std::set<std::string>& suffixes() const { return m_suffixes; }

private:
	std::set<std::string> m_suffixes; // lower case, with the leading dot
};

/// @brief Find files with a matching extension.
/// A path to a regular file yields the file alone if its extension matches.
/// Otherwise the path is enumerated recursively as a directory.
/// @param path    a path to a file or folder
/// @param exts    accepted extensions
/// @return        absolute paths without duplicates, in traversal order.
///                Empty if the path does not exist.
std::vector<std::string> discover(const std::string& path, const extension_set& exts);


enum class rejection_reason
{
	not_found,
	not_a_file,
	not_readable,
};

const char* to_string(rejection_reason reason);

struct asset_rejection
{
	std::string      path;
	rejection_reason reason;
};

struct validation_result
{
	std::vector<source_asset>    assets;
	std::vector<asset_rejection> rejections;
};

/// Tells whether the current process may read a regular file.
typedef std::function<bool(const std::filesystem::path&)> readable_fn;

/// access(R_OK) of the calling process.
bool is_readable(const std::filesystem::path& p);

/// @brief Resolve each path to an absolute one and check that it can be uploaded.
/// A rejected path does not stop the validation of the remaining ones.
validation_result validate(const std::vector<std::string>& paths, const readable_fn& readable = is_readable);

} // namespace discovery
} // namespace vupload
