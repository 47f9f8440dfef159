#pragma once
#include <cstdint>
#include <string>

namespace vupload
{

/// Remove leading and trailing whitespace.
std::string trim(const std::string& str);

std::string to_lower(std::string str);

inline bool starts_with(const std::string& str, const char* prefix)
{
	return str.rfind(prefix, 0) == 0;
}

/// Bytes to MiB, the unit of all size reports.
inline double to_megabytes(int64_t bytes)
{
	return static_cast<double>(bytes) / (1024 * 1024);
}

} // namespace vupload
