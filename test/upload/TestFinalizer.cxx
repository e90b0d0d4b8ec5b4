// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Fixture.hxx"
#include "io/Open.hxx"
#include "io/RecursiveDelete.hxx"

#include <gtest/gtest.h>

#include <fmt/format.h>

TEST(UploadFinalizer, Complete)
{
	UploadFixture f;
	const auto data = MakeTestData(10000);

	/* out of order */
	f.Send("movie.mp4", 3, 3, data.size(), std::string_view{data}.substr(8000));
	f.Send("movie.mp4", 1, 3, data.size(), std::string_view{data}.substr(0, 4000));
	const auto chunk = f.Send("movie.mp4", 2, 3, data.size(),
				  std::string_view{data}.substr(4000, 4000));
	EXPECT_EQ(chunk.received, 3u);

	const auto result = RunTask(f.event_loop,
				    f.Finalize("movie.mp4", 3, data.size()));
	EXPECT_EQ(result.filename, chunk.storage_name);
	EXPECT_EQ(result.size, data.size());

	EXPECT_EQ(ReadFile(f.videos.GetFileDescriptor(),
			   result.filename.c_str()),
		  data);

	/* the session and its chunks are gone */
	EXPECT_TRUE(f.registry.empty());
	EXPECT_FALSE(FileExists(f.chunks.GetFileDescriptor(),
				chunk.storage_name.c_str()));

	/* finalizing again fails */
	EXPECT_EQ(CatchUploadError(f.event_loop,
				   f.Finalize("movie.mp4", 3, data.size())).GetCode(),
		  UploadErrorCode::UNKNOWN_SESSION);
}

TEST(UploadFinalizer, Incomplete)
{
	UploadFixture f;
	f.Send("movie.mp4", 1, 4, 12, "abc");
	const auto chunk = f.Send("movie.mp4", 3, 4, 12, "ghi");

	const auto e = CatchUploadError(f.event_loop,
					f.Finalize("movie.mp4", 4, 12));
	EXPECT_EQ(e.GetCode(), UploadErrorCode::INCOMPLETE_UPLOAD);
	EXPECT_EQ(e.GetMissing(), (std::vector<unsigned>{2, 4}));

	/* nothing was published; the session survives */
	EXPECT_FALSE(FileExists(f.videos.GetFileDescriptor(),
				chunk.storage_name.c_str()));
	EXPECT_NE(f.registry.Find("movie.mp4"), nullptr);

	/* the upload can be completed later */
	f.Send("movie.mp4", 2, 4, 12, "def");
	f.Send("movie.mp4", 4, 4, 12, "jkl");

	const auto result = RunTask(f.event_loop,
				    f.Finalize("movie.mp4", 4, 12));
	EXPECT_EQ(ReadFile(f.videos.GetFileDescriptor(),
			   result.filename.c_str()),
		  "abcdefghijkl");
}

TEST(UploadFinalizer, UnknownSession)
{
	UploadFixture f;
	EXPECT_EQ(CatchUploadError(f.event_loop,
				   f.Finalize("movie.mp4", 1, 3)).GetCode(),
		  UploadErrorCode::UNKNOWN_SESSION);
	EXPECT_EQ(CatchUploadError(f.event_loop,
				   f.Finalize("", 1, 3)).GetCode(),
		  UploadErrorCode::INVALID_FILENAME);
}

TEST(UploadFinalizer, SessionMismatch)
{
	UploadFixture f;
	f.Send("movie.mp4", 1, 1, 3, "abc");

	EXPECT_EQ(CatchUploadError(f.event_loop,
				   f.Finalize("movie.mp4", 2, 3)).GetCode(),
		  UploadErrorCode::SESSION_MISMATCH);
	EXPECT_EQ(CatchUploadError(f.event_loop,
				   f.Finalize("movie.mp4", 1, 4)).GetCode(),
		  UploadErrorCode::SESSION_MISMATCH);
}

TEST(UploadFinalizer, SizeMismatch)
{
	UploadFixture f;
	f.Send("movie.mp4", 1, 2, 10, "abc");
	const auto chunk = f.Send("movie.mp4", 2, 2, 10, "def");

	const auto e = CatchUploadError(f.event_loop,
					f.Finalize("movie.mp4", 2, 10));
	EXPECT_EQ(e.GetCode(), UploadErrorCode::SIZE_MISMATCH);
	EXPECT_EQ(e.GetExpected(), 10u);
	EXPECT_EQ(e.GetActual(), 6u);

	EXPECT_FALSE(FileExists(f.videos.GetFileDescriptor(),
				chunk.storage_name.c_str()));
	EXPECT_TRUE(FileExists(f.chunks.GetFileDescriptor(),
			       chunk.storage_name.c_str()));
	EXPECT_NE(f.registry.Find("movie.mp4"), nullptr);
}

TEST(UploadFinalizer, ChunkFileVanished)
{
	UploadFixture f;
	f.Send("movie.mp4", 1, 2, 6, "abc");
	const auto chunk = f.Send("movie.mp4", 2, 2, 6, "def");

	const auto directory =
		OpenDirectory({f.chunks.GetFileDescriptor(),
			       chunk.storage_name.c_str()});
	ASSERT_EQ(unlinkat(directory.Get(), "1", 0), 0);

	const auto e = CatchUploadError(f.event_loop,
					f.Finalize("movie.mp4", 2, 6));
	EXPECT_EQ(e.GetCode(), UploadErrorCode::INCOMPLETE_UPLOAD);
	EXPECT_EQ(e.GetMissing(), (std::vector<unsigned>{1}));
}

TEST(UploadFinalizer, ChunkDirectoryVanished)
{
	UploadFixture f;
	const auto chunk = f.Send("movie.mp4", 1, 2, 6, "abc");
	f.Send("movie.mp4", 2, 2, 6, "def");

	RecursiveDelete({f.chunks.GetFileDescriptor(),
			 chunk.storage_name.c_str()});

	const auto e = CatchUploadError(f.event_loop,
					f.Finalize("movie.mp4", 2, 6));
	EXPECT_EQ(e.GetCode(), UploadErrorCode::INCOMPLETE_UPLOAD);
	EXPECT_EQ(e.GetMissing(), (std::vector<unsigned>{1, 2}));
}

TEST(UploadFinalizer, ArtifactExists)
{
	UploadFixture f;
	const auto chunk = f.Send("movie.mp4", 1, 1, 3, "abc");

	WriteFile(f.videos.GetFileDescriptor(), chunk.storage_name.c_str(),
		  "old");

	EXPECT_EQ(CatchUploadError(f.event_loop,
				   f.Finalize("movie.mp4", 1, 3)).GetCode(),
		  UploadErrorCode::ARTIFACT_EXISTS);

	/* the existing file was not touched */
	EXPECT_EQ(ReadFile(f.videos.GetFileDescriptor(),
			   chunk.storage_name.c_str()),
		  "old");
	EXPECT_NE(f.registry.Find("movie.mp4"), nullptr);
}

/**
 * Two concurrent finalize requests for the same upload: exactly one
 * of them succeeds.
 */
TEST(UploadFinalizer, Concurrent)
{
	UploadFixture f;
	f.Send("movie.mp4", 1, 2, 6, "abc");
	f.Send("movie.mp4", 2, 2, 6, "def");

	std::optional<FinalizeResult> result1, result2;

	TaskRunner runner1(f.event_loop), runner2(f.event_loop);
	runner1.Start(AwaitAndStore(f.Finalize("movie.mp4", 2, 6), result1));
	runner2.Start(AwaitAndStore(f.Finalize("movie.mp4", 2, 6), result2));

	unsigned n_success = 0, n_unknown = 0;
	for (auto *runner : {&runner1, &runner2}) {
		try {
			runner->Wait();
			++n_success;
		} catch (const UploadError &e) {
			EXPECT_EQ(e.GetCode(), UploadErrorCode::UNKNOWN_SESSION);
			++n_unknown;
		}
	}

	EXPECT_EQ(n_success, 1u);
	EXPECT_EQ(n_unknown, 1u);

	const auto &result = result1 ? *result1 : *result2;
	EXPECT_EQ(ReadFile(f.videos.GetFileDescriptor(),
			   result.filename.c_str()),
		  "abcdef");
	EXPECT_TRUE(f.registry.empty());
}

/**
 * A chunk arriving while the upload is being finalized waits for the
 * finalizer and is then rejected.
 */
TEST(UploadFinalizer, ChunkDuringFinalize)
{
	UploadFixture f;
	f.Send("movie.mp4", 1, 2, 6, "abc");
	f.Send("movie.mp4", 2, 2, 6, "def");

	std::optional<FinalizeResult> result;
	std::optional<UploadChunkResult> chunk_result;

	TaskRunner runner1(f.event_loop), runner2(f.event_loop);
	runner1.Start(AwaitAndStore(f.Finalize("movie.mp4", 2, 6), result));
	runner2.Start(AwaitAndStore(f.Receive("movie.mp4", 2, 2, 6, "xyz"),
				    chunk_result));

	runner1.Wait();
	ASSERT_TRUE(result);

	try {
		runner2.Wait();
		FAIL();
	} catch (const UploadError &e) {
		EXPECT_EQ(e.GetCode(), UploadErrorCode::UNKNOWN_SESSION);
	}

	EXPECT_EQ(ReadFile(f.videos.GetFileDescriptor(),
			   result->filename.c_str()),
		  "abcdef");
}
