// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "event/TimerEvent.hxx"
#include "io/FileDescriptor.hxx"
#include "io/Logger.hxx"

#include <algorithm>
#include <chrono>

class UploadSessionRegistry;

/**
 * Periodically discards abandoned upload sessions together with
 * their chunks.
 */
class UploadPruner {
	const LLogger logger{"upload"};

	UploadSessionRegistry &registry;

	const FileDescriptor chunk_directory;

	const Event::Duration timeout;

	/**
	 * The interval of the periodic expiry check.
	 */
	const Event::Duration interval;

	TimerEvent timer;

public:
	UploadPruner(EventLoop &event_loop, UploadSessionRegistry &_registry,
		     FileDescriptor _chunk_directory,
		     Event::Duration _timeout) noexcept
		:registry(_registry), chunk_directory(_chunk_directory),
		 timeout(_timeout),
		 interval(std::min<Event::Duration>(_timeout,
						    std::chrono::minutes{10})),
		 timer(event_loop, BIND_THIS_METHOD(OnTimer)) {}

	void Start() noexcept {
		timer.Schedule(interval);
	}

	void Stop() noexcept {
		timer.Cancel();
	}

	/**
	 * Delete all chunk directories which do not belong to a
	 * session and have not been modified for longer than the
	 * timeout.  This is used at startup to clean up after a
	 * previous process.
	 *
	 * Throws on error.
	 *
	 * @return the number of directories which were deleted
	 */
	unsigned DeleteStaleDirectories(std::chrono::system_clock::time_point now);

	/**
	 * Remove all expired sessions from the registry and delete
	 * their chunks.
	 *
	 * @return the number of sessions which were removed
	 */
	unsigned RemoveExpired(Event::TimePoint now) noexcept;

private:
	void DeleteChunks(const char *storage_name) noexcept;

	void OnTimer() noexcept;
};
