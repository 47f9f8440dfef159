#include <cstdlib>
#include <fstream>
#include <map>
#include <sstream>

#include <gtest/gtest.h>

#include "upload_config.hpp"
#include "temp_dir.hpp"

using namespace std;
using namespace vupload;

namespace
{

env_lookup_fn lookup_in(const map<string, string>& vars)
{
	return [vars](const string& name) -> optional<string> {
		const auto it = vars.find(name);
		if (it == vars.end())
			return nullopt;
		return it->second;
	};
}

} // namespace

TEST(UploadConfig, ReadsAllVariables)
{
	const upload_config cfg = load_upload_config(lookup_in({
		{ "IBMCLOUD_API_KEY", "key" },
		{ "IBMCLOUD_BUCKET", "bucket" },
		{ "IBMCLOUD_COS_INSTANCE_ID", "instance" },
		{ "IBMCLOUD_COS_ENDPOINT", "s3.example.com" },
		{ "ASPERA_REMOTE_HOST", "ats-sl-dal.aspera.io" },
		{ "COS_DESTINATION", "/videos/" },
	}), false);

	EXPECT_EQ(cfg.api_key, "key");
	EXPECT_EQ(cfg.bucket, "bucket");
	EXPECT_EQ(cfg.service_instance_id, "instance");
	EXPECT_EQ(cfg.service_endpoint, "s3.example.com"); // normalized by the request builder
	EXPECT_EQ(cfg.remote_host, "ats-sl-dal.aspera.io");
	EXPECT_EQ(cfg.destination_prefix, "/videos/");
	EXPECT_FALSE(cfg.create_destination_dir);
}

TEST(UploadConfig, DefaultsForOptionalVariables)
{
	const upload_config cfg = load_upload_config(lookup_in({}), true);

	EXPECT_TRUE(cfg.api_key.empty());
	EXPECT_TRUE(cfg.service_endpoint.empty());
	EXPECT_EQ(cfg.remote_host, "ats-sl-fra.aspera.io");
	EXPECT_EQ(cfg.destination_prefix, "/aspera-uploads");
	EXPECT_TRUE(cfg.create_destination_dir);
}

TEST(EnvFile, Parse)
{
	istringstream in(
		"# credentials\n"
		"IBMCLOUD_API_KEY=abc123\n"
		"\n"
		"export IBMCLOUD_BUCKET = my-bucket\n"
		"COS_DESTINATION=\"/with spaces/\"\n"
		"ASPERA_REMOTE_HOST='ats-sl-fra.aspera.io'\n"
		"IBMCLOUD_COS_ENDPOINT=s3.example.com # eu-de\n"
		"not a variable\n"
		"EMPTY=\n");

	const map<string, string> vars = parse_env_file(in);

	EXPECT_EQ(vars.size(), 6u);
	EXPECT_EQ(vars.at("IBMCLOUD_API_KEY"), "abc123");
	EXPECT_EQ(vars.at("IBMCLOUD_BUCKET"), "my-bucket");
	EXPECT_EQ(vars.at("COS_DESTINATION"), "/with spaces/");
	EXPECT_EQ(vars.at("ASPERA_REMOTE_HOST"), "ats-sl-fra.aspera.io");
	EXPECT_EQ(vars.at("IBMCLOUD_COS_ENDPOINT"), "s3.example.com");
	EXPECT_EQ(vars.at("EMPTY"), "");
}

TEST(EnvFile, QuotedValuesWithComments)
{
	istringstream in(
		"QUOTED_COMMENT=\"abc\" # note\n"
		"HASH_INSIDE='a # b'\n"
		"HASH_INSIDE_COMMENT=\"a # b\"   # trailing\n"
		"UNTERMINATED=\"abc # note\n");

	const map<string, string> vars = parse_env_file(in);

	EXPECT_EQ(vars.at("QUOTED_COMMENT"), "abc");
	EXPECT_EQ(vars.at("HASH_INSIDE"), "a # b");
	EXPECT_EQ(vars.at("HASH_INSIDE_COMMENT"), "a # b");
	EXPECT_EQ(vars.at("UNTERMINATED"), "\"abc");
}

TEST(EnvFile, LoadDoesNotOverrideEnvironment)
{
	test::temp_dir dir;
	const string path = (dir.path() / ".env").string();
	{
		ofstream file(path);
		file << "VUPLOAD_TEST_PRESET=from_file\nVUPLOAD_TEST_NEW=from_file\n";
	}

	setenv("VUPLOAD_TEST_PRESET", "from_env", 1);
	unsetenv("VUPLOAD_TEST_NEW");

	EXPECT_EQ(load_env_file(path), 1u);
	EXPECT_STREQ(getenv("VUPLOAD_TEST_PRESET"), "from_env");
	EXPECT_STREQ(getenv("VUPLOAD_TEST_NEW"), "from_file");

	const env_lookup_fn lookup = process_environment();
	EXPECT_EQ(lookup("VUPLOAD_TEST_NEW"), optional<string>("from_file"));
	EXPECT_FALSE(lookup("VUPLOAD_TEST_UNSET_VARIABLE").has_value());

	unsetenv("VUPLOAD_TEST_PRESET");
	unsetenv("VUPLOAD_TEST_NEW");
}

TEST(EnvFile, MissingFileIsNotAnError)
{
	test::temp_dir dir;
	EXPECT_EQ(load_env_file((dir.path() / "absent.env").string()), 0u);
}
