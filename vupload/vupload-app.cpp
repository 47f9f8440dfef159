#include <atomic>
#include <iostream>
#include <signal.h>

// Third party libraries
#include "CLI/CLI.hpp"
#include "spdlog/spdlog.h"

// vupload
#include "upload.hpp"
#include "upload_config.hpp"

#ifndef VUPLOAD_VERSION
#define VUPLOAD_VERSION "0.0.0"
#endif

using namespace std;

atomic_bool force_break(false);

void OnINT_ForceExit(int)
{
	cerr << "\n-------- REQUESTED INTERRUPT!\n";
	force_break = true;
}

int main(int argc, char** argv)
{
	using namespace vupload;

	CLI::App app("Upload video files to IBM Cloud Object Storage using IBM Aspera. vupload v" VUPLOAD_VERSION);
	app.set_config("--config");
	app.set_help_all_flag("--help-all", "Expand all help");

	spdlog::set_pattern("%H:%M:%S.%f %^[%L]%$ %v");
	upload::add_general_options(app, VUPLOAD_VERSION);

	app.add_flag_function(
		"--handle-sigint",
		[](size_t) {
			signal(SIGINT, OnINT_ForceExit);
			signal(SIGTERM, OnINT_ForceExit);
		},
		"Handle Ctrl+C interrupt");

	upload::config cfg;
	upload::add_options(app, cfg);

	CLI11_PARSE(app, argc, argv);

	load_env_file(cfg.env_file);
	const upload_config upload_cfg = load_upload_config(process_environment(), !cfg.no_folder_marker);

	return upload::run(cfg, upload_cfg, force_break);
}
