#pragma once
#include <atomic>
#include <iostream>
#include <string>
#include <vector>

// Third party libraries
#include "CLI/CLI.hpp"

// vupload
#include "transfer_session.hpp"
#include "upload_config.hpp"

namespace vupload
{
namespace upload
{

struct config
{
	std::string              src_path          = ".";
	bool                     dry_run           = false; // Print the transfer spec, do not transfer
	std::string              daemon_address    = "localhost:55002";
	bool                     no_folder_marker  = false; // file_system.create_dir = false
	std::string              env_file          = ".env";
	std::vector<std::string> extensions        = { ".mp4", ".mov" };
	int                      connect_timeout_s = 5;
	int                      watchdog_s        = 300;
};

/// @brief Discover, validate, submit and monitor an upload.
/// @param cfg         run options
/// @param upload_cfg  credentials and destination
/// @param out         receives the transfer spec of a dry run
/// @return process exit code
int run(const config& cfg, const upload_config& upload_cfg, const std::atomic_bool& force_break,
	std::ostream& out = std::cout,
	const session::transfer_session::client_factory& factory = rpc::make_grpc_client);

void add_options(CLI::App& app, config& cfg);

/// Logging and version flags shared by every run.
/// "--version" prints the version and ends parsing with CLI::Success.
void add_general_options(CLI::App& app, const std::string& version);

} // namespace upload
} // namespace vupload
