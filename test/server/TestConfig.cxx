// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "../io/TempDirectory.hxx"
#include "server/Config.hxx"

#include <gtest/gtest.h>

static Config
LoadConfig(const TempDirectory &directory, std::string_view contents)
{
	WriteFile(directory.GetFileDescriptor(), "vidstream.conf", contents);

	Config config;
	LoadConfigFile(config, std::filesystem::path{directory.GetPath()} / "vidstream.conf");
	return config;
}

TEST(Config, Defaults)
{
	const Config config;
	EXPECT_EQ(config.listen_port, 5001u);
	EXPECT_EQ(config.upload.max_chunk_size, 2u * 1024 * 1024);
	EXPECT_EQ(config.upload.max_upload_size, UINT64_C(500) * 1024 * 1024);
	EXPECT_EQ(config.upload.session_timeout, std::chrono::hours{24});
	EXPECT_TRUE(config.cors_origin.empty());
	EXPECT_NO_THROW(config.Check());
}

TEST(Config, Load)
{
	const TempDirectory directory;
	const auto config = LoadConfig(directory, R"(
# vidstream configuration
@set base="/srv/vidstream"

listen 8080
video_directory "${base}/videos"
chunk_directory chunks
max_chunk_size 1M
max_upload_size 2G
stream_block_size 128k
session_timeout 3600
cors_origin "http://localhost:3000"
verbose 3
)");

	EXPECT_EQ(config.listen_port, 8080u);
	EXPECT_EQ(config.video_directory, "/srv/vidstream/videos");

	/* relative to the configuration file */
	EXPECT_EQ(config.chunk_directory,
		  std::filesystem::path{directory.GetPath()} / "chunks");

	EXPECT_EQ(config.upload.max_chunk_size, 1024u * 1024);
	EXPECT_EQ(config.upload.max_upload_size, UINT64_C(2) * 1024 * 1024 * 1024);
	EXPECT_EQ(config.stream_block_size, 128u * 1024);
	EXPECT_EQ(config.upload.session_timeout, std::chrono::hours{1});
	EXPECT_EQ(config.cors_origin, "http://localhost:3000");
	EXPECT_EQ(config.verbose, 3u);
	EXPECT_NO_THROW(config.Check());
}

TEST(Config, Errors)
{
	const TempDirectory directory;

	EXPECT_ANY_THROW(LoadConfig(directory, "foo bar\n"));
	EXPECT_ANY_THROW(LoadConfig(directory, "listen\n"));
	EXPECT_ANY_THROW(LoadConfig(directory, "listen 70000\n"));
	EXPECT_ANY_THROW(LoadConfig(directory, "listen 80 81\n"));
	EXPECT_ANY_THROW(LoadConfig(directory, "max_chunk_size 0\n"));
	EXPECT_ANY_THROW(LoadConfig(directory, "max_chunk_size abc\n"));
	EXPECT_ANY_THROW(LoadConfig(directory, "video_directory ${undefined}\n"));

	Config config;
	EXPECT_ANY_THROW(LoadConfigFile(config, std::filesystem::path{directory.GetPath()} / "nonexistent.conf"));
}

TEST(Config, Check)
{
	Config config;
	config.stream_block_size = 0;
	EXPECT_ANY_THROW(config.Check());
}
