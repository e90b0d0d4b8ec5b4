// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Fixture.hxx"
#include "upload/Pruner.hxx"
#include "io/MakeDirectory.hxx"
#include "event/TimerEvent.hxx"

#include <gtest/gtest.h>

#include <fcntl.h>
#include <sys/stat.h>

using std::chrono::hours;

/**
 * Set the modification time of a directory entry.
 */
static void
SetAge(FileDescriptor directory, const char *name,
       std::chrono::system_clock::duration age)
{
	const auto t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now() - age);
	const struct timespec times[2]{{t, 0}, {t, 0}};
	if (utimensat(directory.Get(), name, times, AT_SYMLINK_NOFOLLOW) < 0)
		throw MakeErrno("utimensat() failed");
}

TEST(UploadPruner, RemoveExpired)
{
	UploadFixture f;
	f.config.session_timeout = hours{1};

	UploadPruner pruner(f.event_loop, f.registry,
			    f.chunks.GetFileDescriptor(),
			    f.config.session_timeout);

	const auto chunk = f.Send("movie.mp4", 1, 2, 6, "abc");
	ASSERT_TRUE(FileExists(f.chunks.GetFileDescriptor(),
			       chunk.storage_name.c_str()));

	const auto now = f.event_loop.SteadyNow();
	EXPECT_EQ(pruner.RemoveExpired(now), 0u);
	EXPECT_EQ(f.registry.size(), 1u);

	EXPECT_EQ(pruner.RemoveExpired(now + hours{2}), 1u);
	EXPECT_TRUE(f.registry.empty());
	EXPECT_FALSE(FileExists(f.chunks.GetFileDescriptor(),
				chunk.storage_name.c_str()));

	/* the expired upload cannot be finalized */
	EXPECT_EQ(CatchUploadError(f.event_loop,
				   f.Finalize("movie.mp4", 2, 6)).GetCode(),
		  UploadErrorCode::UNKNOWN_SESSION);

	/* a new upload with the same name starts from scratch */
	const auto again = f.Send("movie.mp4", 2, 2, 6, "def");
	EXPECT_EQ(again.received, 1u);
}

TEST(UploadPruner, DeleteStaleDirectories)
{
	UploadFixture f;

	UploadPruner pruner(f.event_loop, f.registry,
			    f.chunks.GetFileDescriptor(), hours{1});

	const auto chunks = f.chunks.GetFileDescriptor();

	/* left behind by a previous process */
	MakeDirectory(chunks, "1_old.mp4");
	WriteFile(OpenDirectory({chunks, "1_old.mp4"}), "1", "abc");
	SetAge(chunks, "1_old.mp4", hours{2});

	/* too young */
	MakeDirectory(chunks, "2_fresh.mp4");

	/* not a directory */
	WriteFile(chunks, "stray", "x");
	SetAge(chunks, "stray", hours{2});

	/* belongs to a session */
	const auto chunk = f.Send("movie.mp4", 1, 2, 6, "abc");
	SetAge(chunks, chunk.storage_name.c_str(), hours{2});

	EXPECT_EQ(pruner.DeleteStaleDirectories(std::chrono::system_clock::now()), 1u);

	EXPECT_FALSE(FileExists(chunks, "1_old.mp4"));
	EXPECT_TRUE(FileExists(chunks, "2_fresh.mp4"));
	EXPECT_TRUE(FileExists(chunks, "stray"));
	EXPECT_TRUE(FileExists(chunks, chunk.storage_name.c_str()));
}

namespace {

struct PrunerStopper {
	UploadPruner &pruner;
	TimerEvent timer;

	PrunerStopper(EventLoop &event_loop, UploadPruner &_pruner) noexcept
		:pruner(_pruner),
		 timer(event_loop, BIND_THIS_METHOD(OnTimer)) {}

	void OnTimer() noexcept {
		pruner.Stop();
	}
};

} // anonymous namespace

TEST(UploadPruner, Timer)
{
	UploadFixture f;

	UploadPruner pruner(f.event_loop, f.registry,
			    f.chunks.GetFileDescriptor(),
			    std::chrono::milliseconds{10});

	const auto chunk = f.Send("movie.mp4", 1, 2, 6, "abc");
	ASSERT_EQ(f.registry.size(), 1u);

	PrunerStopper stopper(f.event_loop, pruner);
	stopper.timer.Schedule(std::chrono::milliseconds{200});

	pruner.Start();
	f.event_loop.Run();

	EXPECT_TRUE(f.registry.empty());
	EXPECT_FALSE(FileExists(f.chunks.GetFileDescriptor(),
				chunk.storage_name.c_str()));
}
