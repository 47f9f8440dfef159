#pragma once
#include <stdexcept>
#include <string>
#include <vector>

namespace vupload
{

/// Base of all fatal conditions of an upload run.
class exception : public std::runtime_error
{
public:
	explicit exception(const std::string& err)
		: std::runtime_error(err)
	{
	}
};

/// Required credential or endpoint fields are missing.
/// Raised only right before a real submission.
class configuration_error : public exception
{
public:
	explicit configuration_error(const std::vector<std::string>& missing);

public:
	/// Names of the missing fields (environment variable names).
	const std::vector<std::string>& missing() const { return m_missing; }

private:
	const std::vector<std::string> m_missing;
};

/// The transfer daemon can't be reached.
class connection_error : public exception
{
public:
	using exception::exception;
};

/// The daemon rejected the transfer request. what() holds the daemon message verbatim.
class submission_error : public exception
{
public:
	using exception::exception;
};

/// The status stream failed or ended before a terminal state.
class monitoring_error : public exception
{
public:
	using exception::exception;
};

/// @brief Get an actionable hint for a known daemon error message.
/// @return the hint lines, or an empty vector if the message is not recognized
std::vector<std::string> hint_for(const std::string& daemon_message);

} // namespace vupload
