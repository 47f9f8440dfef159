#include <chrono>
#include <future>
#include <memory>

#include "upload.hpp"
#include "errors.hpp"
#include "file_discovery.hpp"
#include "misc.hpp"
#include "progress_monitor.hpp"
#include "transfer_request.hpp"

// submodules
#include "spdlog/spdlog.h"

using namespace std;
using namespace std::chrono;
using namespace vupload;
using namespace vupload::upload;

#define LOG_SC_UPLOAD "UPLOAD "

namespace
{

void report_hint(const string& message)
{
	for (const string& line : hint_for(message))
		spdlog::error(line);
}

/// Print validated files with their sizes.
void report_assets(const vector<source_asset>& assets)
{
	spdlog::info("Found {} video(s) to upload:", assets.size());

	int64_t total = 0;
	for (const source_asset& asset : assets)
	{
		if (asset.size_bytes < 0)
		{
			spdlog::info("  - {}", asset.absolute_path);
			continue;
		}

		spdlog::info("  - {} ({:.1f} MB)", asset.absolute_path, to_megabytes(asset.size_bytes));
		total += asset.size_bytes;
	}

	spdlog::info("Total size: {:.1f} MB", to_megabytes(total));
}

/// Pull status updates on a worker, so that an interrupt can cancel a blocked read.
monitor::outcome monitor_transfer(session::transfer_session& sess, const string& transfer_id,
	monitor::progress_monitor& progress, const atomic_bool& force_break)
{
	unique_ptr<rpc::isample_stream> stream = sess.monitor(transfer_id);

	future<monitor::outcome> monitoring = async(launch::async,
		[&progress, &stream, &force_break]() { return progress.run(*stream, force_break); });

	bool cancelled = false;
	while (monitoring.wait_for(milliseconds(100)) != future_status::ready)
	{
		if (force_break && !cancelled)
		{
			spdlog::debug(LOG_SC_UPLOAD "Cancelling the status stream of {}.", transfer_id);
			stream->cancel();
			cancelled = true;
		}
	}

	return monitoring.get();
}

int report_outcome(const monitor::outcome& result, const config& cfg)
{
	if (result.interrupted)
	{
		spdlog::warn("Monitoring interrupted. Transfer {} may still be running.", result.transfer_id);
		return 1;
	}

	switch (result.status.state)
	{
	case transfer_state::completed:
		spdlog::info("Transfer completed successfully!");
		return 0;
	case transfer_state::failed:
		spdlog::error("Transfer failed!");
		return 1;
	case transfer_state::timed_out:
		spdlog::warn("Timeout ({}s). Transfer may still be running.", cfg.watchdog_s);
		return 0;
	default:
		break;
	}

	spdlog::error(LOG_SC_UPLOAD "Monitoring stopped in state {}.", to_string(result.status));
	return 1;
}

} // namespace

int vupload::upload::run(const config& cfg, const upload_config& upload_cfg, const atomic_bool& force_break,
	ostream& out, const session::transfer_session::client_factory& factory)
{
	const discovery::extension_set exts(cfg.extensions);
	const vector<string> filenames = discovery::discover(cfg.src_path, exts);
	if (filenames.empty())
	{
		spdlog::error("No videos found (path {}).", cfg.src_path);
		return 1;
	}

	const discovery::validation_result validated = discovery::validate(filenames);
	for (const discovery::asset_rejection& r : validated.rejections)
		spdlog::error("{}: {}", discovery::to_string(r.reason), r.path);

	if (validated.assets.empty())
	{
		spdlog::error("No valid, readable source files to upload.");
		return 1;
	}

	report_assets(validated.assets);

	const request::transfer_request req = request::build(upload_cfg, validated.assets);

	if (cfg.dry_run)
	{
		out << "\n--- DRY RUN ---\n" << req.to_string(true) << endl;
		spdlog::info("Dry run complete.");
		return 0;
	}

	try
	{
		session::transfer_session sess(cfg.daemon_address, seconds(cfg.connect_timeout_s), factory);
		sess.connect();
		session::transfer_session::validate_for_submission(req.config());

		spdlog::info("Starting transfer...");
		const string transfer_id = sess.submit(req);
		spdlog::info("Transfer started with ID: {}", transfer_id);

		monitor::progress_monitor progress(req.total_size_bytes(), seconds(cfg.watchdog_s));
		const monitor::outcome result = monitor_transfer(sess, transfer_id, progress, force_break);
		return report_outcome(result, cfg);
	}
	catch (const configuration_error& e)
	{
		spdlog::error("{}", e.what());
	}
	catch (const connection_error& e)
	{
		spdlog::error("Could not connect: {}", e.what());
	}
	catch (const submission_error& e)
	{
		spdlog::error("Transfer error: {}", e.what());
		report_hint(e.what());
	}
	catch (const monitoring_error& e)
	{
		spdlog::error("Monitoring error: {}", e.what());
		report_hint(e.what());
	}

	return 1;
}

void vupload::upload::add_options(CLI::App& app, config& cfg)
{
	app.add_option("directory", cfg.src_path, "Directory (or single file) to scan for videos")
		->capture_default_str();
	app.add_flag("--dry-run", cfg.dry_run, "Show transfer spec without uploading");
	app.add_option("--transfer-manager-host", cfg.daemon_address, "Transfer Manager host:port")
		->capture_default_str();
	app.add_flag("--no-folder-marker", cfg.no_folder_marker,
		"Do not create destination folder marker (sets file_system.create_dir=false)");
	app.add_option("--env-file", cfg.env_file, "File with IBMCLOUD_* and other variables")
		->capture_default_str();
	app.add_option("--ext", cfg.extensions, "File extensions to upload (repeatable)")
		->capture_default_str();
	app.add_option("--connect-timeout", cfg.connect_timeout_s,
		fmt::format("Seconds to wait for the Transfer Manager (default {})", cfg.connect_timeout_s))
		->check(CLI::PositiveNumber);
	app.add_option("--watchdog", cfg.watchdog_s,
		fmt::format("Stop monitoring after this many seconds (default {})", cfg.watchdog_s))
		->check(CLI::PositiveNumber);
}

void vupload::upload::add_general_options(CLI::App& app, const string& version)
{
	app.add_flag_function(
		"--verbose,-v",
		[](size_t) { spdlog::set_level(spdlog::level::trace); },
		"enable verbose output");

	app.add_option(
		"--loglevel",
		[](CLI::results_t val) {
			const spdlog::level::level_enum lev = spdlog::level::from_str(val[0]);
			// from_str() falls back to "off" for unknown names
			if (lev == spdlog::level::off && val[0] != "off")
				return false;

			spdlog::set_level(lev);
			spdlog::info("Log level set to {}", val[0]);
			return true;
		},
		"log level [trace, debug, info, warning, error, critical, off]");

	app.add_flag_function(
		"--version",
		[version](size_t) {
			cerr << "vupload v" << version << endl;
			throw CLI::Success();
		},
		"Show version info");
}
