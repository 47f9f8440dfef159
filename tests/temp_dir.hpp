#pragma once
#include <atomic>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

namespace vupload
{
namespace test
{

/// A unique folder under the system temp directory, removed on destruction.
class temp_dir
{
public:
	temp_dir()
	{
		static std::atomic<int> counter{0};
		const std::string name = "vupload_test_" + std::to_string(::getpid()) + "_" + std::to_string(counter++);
		m_path = std::filesystem::weakly_canonical(std::filesystem::temp_directory_path() / name);
		std::filesystem::remove_all(m_path);
		std::filesystem::create_directories(m_path);
	}

	~temp_dir()
	{
		std::error_code ec;
		std::filesystem::remove_all(m_path, ec);
	}

	const std::filesystem::path& path() const { return m_path; }

	/// Create a file (and its parent folders) with the given number of bytes.
	std::string add_file(const std::string& relative, size_t size = 16) const
	{
		const std::filesystem::path p = m_path / relative;
		std::filesystem::create_directories(p.parent_path());
		std::ofstream file(p, std::ios::binary);
		file << std::string(size, 'x');
		return p.string();
	}

private:
	std::filesystem::path m_path;
};

} // namespace test
} // namespace vupload
