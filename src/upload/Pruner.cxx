// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Pruner.hxx"
#include "Registry.hxx"
#include "event/Loop.hxx"
#include "io/DirectoryReader.hxx"
#include "io/FileAt.hxx"
#include "io/Open.hxx"
#include "io/RecursiveDelete.hxx"
#include "io/UniqueFileDescriptor.hxx"

#include <fcntl.h> // for AT_SYMLINK_NOFOLLOW
#include <sys/stat.h>

void
UploadPruner::DeleteChunks(const char *storage_name) noexcept
{
	try {
		RecursiveDelete({chunk_directory, storage_name});
	} catch (...) {
		logger(1, "failed to delete chunks: ",
		       std::current_exception());
	}
}

unsigned
UploadPruner::DeleteStaleDirectories(std::chrono::system_clock::time_point now)
{
	DirectoryReader reader(OpenDirectory({chunk_directory, "."}));

	unsigned n = 0;
	while (const char *name = reader.Read()) {
		if (registry.HasStorageName(name))
			continue;

		struct stat st;
		if (fstatat(chunk_directory.Get(), name, &st,
			    AT_SYMLINK_NOFOLLOW) < 0 ||
		    !S_ISDIR(st.st_mode))
			continue;

		const auto mtime = std::chrono::system_clock::from_time_t(st.st_mtime);
		if (now - mtime < timeout)
			continue;

		logger.Fmt(2, "deleting stale chunk directory '{}'", name);
		DeleteChunks(name);
		++n;
	}

	return n;
}

unsigned
UploadPruner::RemoveExpired(Event::TimePoint now) noexcept
{
	const auto removed = registry.RemoveExpired(now, timeout);

	for (const auto &storage_name : removed) {
		logger.Fmt(2, "upload '{}' expired", storage_name);
		DeleteChunks(storage_name.c_str());
	}

	return removed.size();
}

void
UploadPruner::OnTimer() noexcept
{
	RemoveExpired(timer.GetEventLoop().SteadyNow());
	timer.Schedule(interval);
}
