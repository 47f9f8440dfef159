#include <deque>
#include <system_error>
#include <unistd.h>

#include "file_discovery.hpp"
#include "misc.hpp"

// submodules
#include "spdlog/spdlog.h"

using namespace std;
namespace fs = std::filesystem;

namespace vupload
{
namespace discovery
{

#define LOG_SC_DISCOVERY "DISCOVERY "

namespace
{

/// Resolve symlinks and relative components where possible.
/// Falls back to a plain absolute path if the path can't be resolved.
fs::path resolve(const fs::path& p)
{
	error_code ec;
	fs::path resolved = fs::weakly_canonical(p, ec);
	if (!ec)
		return resolved;

	resolved = fs::absolute(p, ec);
	return ec ? p : resolved;
}

} // namespace

extension_set::extension_set(initializer_list<string> suffixes)
{
	for (const string& s : suffixes)
		add(s);
}

extension_set::extension_set(const vector<string>& suffixes)
{
	for (const string& s : suffixes)
		add(s);
}

extension_set extension_set::videos()
{
	return extension_set{".mp4", ".mov"};
}

void extension_set::add(const string& suffix)
{
	if (suffix.empty())
		return;

	m_suffixes.insert(to_lower(suffix[0] == '.' ? suffix : "." + suffix));
}

bool extension_set::matches(const fs::path& path) const
{
	const string ext = path.extension().string();
	if (ext.empty())
		return false;

	return m_suffixes.count(to_lower(ext)) > 0;
}

vector<string> discover(const string& path, const extension_set& exts)
{
	vector<string> filenames;
	set<string>    seen;

	auto add_file = [&filenames, &seen](const fs::path& p) {
		const string resolved = resolve(p).string();
		if (seen.insert(resolved).second)
			filenames.push_back(resolved);
	};

	error_code ec;
	const fs::path root(path);

	if (fs::is_regular_file(root, ec))
	{
		if (exts.matches(root))
			add_file(root);
		return filenames;
	}

	if (!fs::is_directory(root, ec))
	{
		spdlog::debug(LOG_SC_DISCOVERY "'{}' is neither a file nor a directory.", path);
		return filenames;
	}

	deque<fs::path> subdirs = { root };

	while (!subdirs.empty())
	{
		const fs::path dir = subdirs.front();
		subdirs.pop_front();

		error_code             iter_ec;
		fs::directory_iterator it(dir, iter_ec);
		if (iter_ec)
		{
			spdlog::warn(LOG_SC_DISCOVERY "Skipping '{}': {}.", dir.string(), iter_ec.message());
			continue;
		}

		for (; it != fs::directory_iterator(); it.increment(iter_ec))
		{
			const fs::directory_entry& entry = *it;
			error_code                 entry_ec;
			// Symlinked folders are not followed to avoid cycles.
			if (entry.is_directory(entry_ec) && !entry.is_symlink(entry_ec))
			{
				subdirs.push_back(entry.path());
				continue;
			}

			if (exts.matches(entry.path()) && entry.is_regular_file(entry_ec))
				add_file(entry.path());
		}

		if (iter_ec)
			spdlog::warn(LOG_SC_DISCOVERY "Failed to read '{}': {}.", dir.string(), iter_ec.message());
	}

	spdlog::debug(LOG_SC_DISCOVERY "Found {} matching file(s) in '{}'.", filenames.size(), path);
	return filenames;
}

const char* to_string(rejection_reason reason)
{
	switch (reason)
	{
	case rejection_reason::not_found:
		return "Source not found";
	case rejection_reason::not_a_file:
		return "Not a file";
	case rejection_reason::not_readable:
		return "Not readable";
	}

	return "Rejected";
}

bool is_readable(const fs::path& p)
{
	return ::access(p.c_str(), R_OK) == 0;
}

validation_result validate(const vector<string>& paths, const readable_fn& readable)
{
	validation_result result;

	for (const string& path : paths)
	{
		const fs::path p = resolve(path);
		error_code ec;

		if (!fs::exists(p, ec))
		{
			result.rejections.push_back({ p.string(), rejection_reason::not_found });
			continue;
		}

		if (!fs::is_regular_file(p, ec))
		{
			result.rejections.push_back({ p.string(), rejection_reason::not_a_file });
			continue;
		}

		if (!readable(p))
		{
			result.rejections.push_back({ p.string(), rejection_reason::not_readable });
			continue;
		}

		source_asset asset;
		asset.absolute_path = p.string();
		const uintmax_t size = fs::file_size(p, ec);
		if (!ec)
			asset.size_bytes = static_cast<int64_t>(size);

		result.assets.push_back(std::move(asset));
	}

	return result;
}

} // namespace discovery
} // namespace vupload
