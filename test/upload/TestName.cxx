// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "upload/Name.hxx"

#include <gtest/gtest.h>

TEST(UploadName, Sanitize)
{
	EXPECT_EQ(SanitizeFilename("movie.mp4"), "movie.mp4");
	EXPECT_EQ(SanitizeFilename("My-Movie_2.MP4"), "My-Movie_2.MP4");
	EXPECT_EQ(SanitizeFilename("  my video (1).mp4\t"), "my_video__1_.mp4");
	EXPECT_EQ(SanitizeFilename("../../etc/passwd"), ".._.._etc_passwd");
	EXPECT_EQ(SanitizeFilename("a\\b"), "a_b");
	EXPECT_EQ(SanitizeFilename("f\xc3\xbc.mp4"), "f__.mp4");
}

TEST(UploadName, SanitizeEmpty)
{
	EXPECT_EQ(SanitizeFilename(""), "");
	EXPECT_EQ(SanitizeFilename(" \t "), "");
}

TEST(UploadName, StorageName)
{
	using namespace std::chrono;
	const system_clock::time_point t{milliseconds{1700000000123}};
	EXPECT_EQ(MakeStorageName("movie.mp4", t), "1700000000123_movie.mp4");
}

TEST(UploadName, VideoExtension)
{
	EXPECT_TRUE(HasVideoExtension("movie.mp4"));
	EXPECT_TRUE(HasVideoExtension("movie.MKV"));
	EXPECT_TRUE(HasVideoExtension("a.b.webm"));
	EXPECT_TRUE(HasVideoExtension(".mov"));
	EXPECT_FALSE(HasVideoExtension("movie.mp4.txt"));
	EXPECT_FALSE(HasVideoExtension("movie"));
	EXPECT_FALSE(HasVideoExtension("mp4"));
	EXPECT_FALSE(HasVideoExtension(""));
}
