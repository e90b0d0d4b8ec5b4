// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Fixture.hxx"
#include "io/DirectoryReader.hxx"
#include "io/Open.hxx"

#include <gtest/gtest.h>

#include <string>

TEST(DirectUpload, Basic)
{
	UploadFixture f;

	/* larger than one write slice */
	const auto data = MakeTestData(3 * 1024 * 1024 + 17);

	const auto result =
		RunTask(f.event_loop,
			f.direct_uploader.Store(f.ctx, " my movie (1).MP4",
						AsBytes(data)));
	EXPECT_TRUE(result.filename.ends_with("_my_movie__1_.MP4"));
	EXPECT_EQ(result.size, data.size());
	EXPECT_EQ(ReadFile(f.videos.GetFileDescriptor(),
			   result.filename.c_str()),
		  data);

	/* nothing was touched in the chunk directory */
	EXPECT_TRUE(f.registry.empty());
}

TEST(DirectUpload, Empty)
{
	UploadFixture f;

	const auto result =
		RunTask(f.event_loop,
			f.direct_uploader.Store(f.ctx, "empty.webm", {}));
	EXPECT_EQ(result.size, 0u);
	EXPECT_EQ(ReadFile(f.videos.GetFileDescriptor(),
			   result.filename.c_str()),
		  "");
}

TEST(DirectUpload, Errors)
{
	UploadFixture f;
	f.config.max_upload_size = 10;

	EXPECT_EQ(CatchUploadError(f.event_loop,
				   f.direct_uploader.Store(f.ctx, "  ",
							   AsBytes(std::string_view{"abc"}))).GetCode(),
		  UploadErrorCode::INVALID_FILENAME);

	EXPECT_EQ(CatchUploadError(f.event_loop,
				   f.direct_uploader.Store(f.ctx, "movie.exe",
							   AsBytes(std::string_view{"abc"}))).GetCode(),
		  UploadErrorCode::INVALID_FILE_TYPE);

	EXPECT_EQ(CatchUploadError(f.event_loop,
				   f.direct_uploader.Store(f.ctx, "movie.mp4",
							   AsBytes(std::string_view{"01234567890"}))).GetCode(),
		  UploadErrorCode::UPLOAD_TOO_LARGE);

	/* nothing was published */
	DirectoryReader reader(OpenDirectory({f.videos.GetFileDescriptor(), "."}));
	while (const char *name = reader.Read())
		ADD_FAILURE() << "unexpected file: " << name;
}
