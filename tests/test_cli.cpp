#include <gtest/gtest.h>

#include "CLI/CLI.hpp"
#include "spdlog/spdlog.h"

#include "upload.hpp"

using namespace vupload;

namespace
{

class CommandLine : public ::testing::Test
{
protected:
	CommandLine()
		: app("vupload")
	{
		upload::add_general_options(app, "1.2.3");
		upload::add_options(app, cfg);
	}

	~CommandLine() override { spdlog::set_level(spdlog::level::info); }

	CLI::App       app;
	upload::config cfg;
};

} // namespace

TEST_F(CommandLine, VersionEndsParsing)
{
	EXPECT_THROW(app.parse("--version", false), CLI::Success);
}

TEST_F(CommandLine, Defaults)
{
	app.parse("", false);

	EXPECT_EQ(cfg.src_path, ".");
	EXPECT_FALSE(cfg.dry_run);
	EXPECT_FALSE(cfg.no_folder_marker);
	EXPECT_EQ(cfg.daemon_address, "localhost:55002");
	EXPECT_EQ(cfg.env_file, ".env");
	EXPECT_EQ(cfg.extensions, (std::vector<std::string>{ ".mp4", ".mov" }));
	EXPECT_EQ(cfg.connect_timeout_s, 5);
	EXPECT_EQ(cfg.watchdog_s, 300);
}

TEST_F(CommandLine, UploadOptions)
{
	app.parse("--dry-run --no-folder-marker --ext mkv --ext .avi --transfer-manager-host daemon:7000 "
		"--env-file prod.env --connect-timeout 2 --watchdog 60 videos",
		false);

	EXPECT_EQ(cfg.src_path, "videos");
	EXPECT_TRUE(cfg.dry_run);
	EXPECT_TRUE(cfg.no_folder_marker);
	EXPECT_EQ(cfg.daemon_address, "daemon:7000");
	EXPECT_EQ(cfg.env_file, "prod.env");
	EXPECT_EQ(cfg.extensions, (std::vector<std::string>{ "mkv", ".avi" }));
	EXPECT_EQ(cfg.connect_timeout_s, 2);
	EXPECT_EQ(cfg.watchdog_s, 60);
}

TEST_F(CommandLine, LogLevel)
{
	app.parse("--loglevel debug", false);
	EXPECT_EQ(spdlog::get_level(), spdlog::level::debug);
}

TEST_F(CommandLine, VerboseEnablesTrace)
{
	app.parse("-v", false);
	EXPECT_EQ(spdlog::get_level(), spdlog::level::trace);
}

TEST_F(CommandLine, RejectsUnknownLogLevel)
{
	EXPECT_THROW(app.parse("--loglevel bogus", false), CLI::ParseError);
}

TEST_F(CommandLine, RejectsNonPositiveTimeouts)
{
	EXPECT_THROW(app.parse("--watchdog 0", false), CLI::ParseError);
}
