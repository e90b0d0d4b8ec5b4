// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "co/Mutex.hxx"
#include "event/Chrono.hxx"

#include <cstdint>
#include <string>
#include <vector>

/**
 * Bookkeeping for the chunks of one upload.  Instances are owned by
 * #UploadSessionRegistry (through std::shared_ptr, because a
 * coroutine may still hold a reference after the session has been
 * removed from the registry).
 */
class UploadSession {
public:
	/**
	 * The sanitized client filename; this is the key in the
	 * registry.
	 */
	const std::string key;

	/**
	 * The unique name of the chunk directory and of the final
	 * file.
	 */
	const std::string storage_name;

	const unsigned total_chunks;

	const uint64_t declared_size;

	/**
	 * Serializes chunk writes and finalization of this session.
	 */
	Co::Mutex mutex;

private:
	/**
	 * Element i is true if chunk i+1 has been received.
	 */
	std::vector<bool> received;

	unsigned n_received = 0;

	Event::TimePoint last_activity;

public:
	UploadSession(std::string &&_key, std::string &&_storage_name,
		      unsigned _total_chunks, uint64_t _declared_size,
		      Event::TimePoint now)
		:key(std::move(_key)), storage_name(std::move(_storage_name)),
		 total_chunks(_total_chunks), declared_size(_declared_size),
		 received(_total_chunks, false),
		 last_activity(now) {}

	UploadSession(const UploadSession &) = delete;
	UploadSession &operator=(const UploadSession &) = delete;

	bool Matches(unsigned _total_chunks,
		     uint64_t _declared_size) const noexcept {
		return _total_chunks == total_chunks &&
			_declared_size == declared_size;
	}

	unsigned GetReceivedCount() const noexcept {
		return n_received;
	}

	bool IsReceived(unsigned chunk_number) const noexcept {
		return chunk_number >= 1 && chunk_number <= total_chunks &&
			received[chunk_number - 1];
	}

	/**
	 * @param chunk_number a valid (1-based) chunk number
	 */
	void MarkReceived(unsigned chunk_number) noexcept {
		if (!received[chunk_number - 1]) {
			received[chunk_number - 1] = true;
			++n_received;
		}
	}

	/**
	 * Returns the (1-based) numbers of all chunks which have not
	 * been received yet.
	 */
	std::vector<unsigned> GetMissing() const;

	void Touch(Event::TimePoint now) noexcept {
		last_activity = now;
	}

	bool IsExpired(Event::TimePoint now,
		       Event::Duration timeout) const noexcept {
		return now - last_activity >= timeout;
	}

	/**
	 * Is a coroutine currently working on this session (or
	 * waiting for it)?
	 */
	bool IsBusy() const noexcept {
		return mutex.IsBusy();
	}
};
