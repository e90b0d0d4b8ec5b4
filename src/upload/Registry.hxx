// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Session.hxx"

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

/**
 * Manages all upload sessions which have not been finalized yet.
 */
class UploadSessionRegistry {
	std::map<std::string, std::shared_ptr<UploadSession>, std::less<>> sessions;

public:
	UploadSessionRegistry() noexcept = default;

	UploadSessionRegistry(const UploadSessionRegistry &) = delete;
	UploadSessionRegistry &operator=(const UploadSessionRegistry &) = delete;

	bool empty() const noexcept {
		return sessions.empty();
	}

	std::size_t size() const noexcept {
		return sessions.size();
	}

	/**
	 * @return the session or nullptr if there is none
	 */
	[[gnu::pure]]
	std::shared_ptr<UploadSession> Find(std::string_view key) const noexcept;

	/**
	 * Create a new session with a new unique storage name.  There
	 * must not be a session with this key already.
	 */
	std::shared_ptr<UploadSession> Create(std::string_view key,
					      unsigned total_chunks,
					      uint64_t declared_size,
					      Event::TimePoint now,
					      std::chrono::system_clock::time_point wall_now);

	/**
	 * Is this session still registered (i.e. not finalized,
	 * expired or replaced)?
	 */
	[[gnu::pure]]
	bool IsCurrent(const UploadSession &session) const noexcept;

	/**
	 * Remove the session from the registry (if it is still
	 * registered).
	 */
	void Remove(const UploadSession &session) noexcept;

	/**
	 * Is there a session using this storage name?
	 */
	[[gnu::pure]]
	bool HasStorageName(std::string_view storage_name) const noexcept;

	/**
	 * Remove all idle sessions which have not seen any activity
	 * for the given duration.  Sessions which are busy are
	 * skipped.
	 *
	 * @return the storage names of the removed sessions
	 */
	std::vector<std::string> RemoveExpired(Event::TimePoint now,
					       Event::Duration timeout) noexcept;
};
