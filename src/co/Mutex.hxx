// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "util/IntrusiveList.hxx"

#include <cassert>
#include <coroutine>

namespace Co {

/**
 * A mutex for coroutines running in one thread: only one coroutine
 * can own the lock, all others are suspended in FIFO order until it
 * is released.
 */
class Mutex final {
	/**
	 * Owns the lock (RAII).  Returned by `co_await mutex`.
	 */
	class Lock {
		Mutex &mutex;

	public:
		explicit Lock(Mutex &_mutex) noexcept
			:mutex(_mutex) {
			mutex.SetLocked();
		}

		~Lock() noexcept {
			/* this resumes the next waiter */
			mutex.Unlock();
		}

		Lock(const Lock &) = delete;
		Lock &operator=(const Lock &) = delete;
	};

	struct Awaitable final : AutoUnlinkIntrusiveListHook {
		Mutex &mutex;

		std::coroutine_handle<> continuation;

		[[nodiscard]]
		explicit Awaitable(Mutex &_mutex) noexcept
			:mutex(_mutex) {}

		Awaitable(const Awaitable &) = delete;
		Awaitable &operator=(const Awaitable &) = delete;

		[[nodiscard]]
		bool await_ready() const noexcept {
			return !mutex.IsLocked();
		}

		void await_suspend(std::coroutine_handle<> _continuation) noexcept {
			assert(!is_linked());
			assert(_continuation);

			continuation = _continuation;
			mutex.requests.push_back(*this);
		}

		[[nodiscard]]
		Lock await_resume() noexcept {
			assert(!is_linked());

			return Lock{mutex};
		}
	};

	IntrusiveList<Awaitable> requests;

	bool locked = false;

public:
	Mutex() noexcept = default;

	~Mutex() noexcept {
		assert(!locked);
		assert(requests.empty());
	}

	Mutex(const Mutex &) = delete;
	Mutex &operator=(const Mutex &) = delete;

	bool IsLocked() const noexcept {
		return locked;
	}

	/**
	 * Does a coroutine own the lock or wait for it?
	 */
	bool IsBusy() const noexcept {
		return locked || !requests.empty();
	}

	/**
	 * Acquire the lock.  The result of `co_await` is a #Lock
	 * object which releases the lock in its destructor.
	 */
	[[nodiscard]]
	auto operator co_await() noexcept {
		return Awaitable{*this};
	}

private:
	void SetLocked() noexcept {
		assert(!locked);

		locked = true;
	}

	void Unlock() noexcept {
		assert(locked);
		locked = false;

		if (!requests.empty())
			requests.pop_front_and_dispose([](Awaitable *awaitable){
				awaitable->continuation.resume();
			});
	}
};

} // namespace Co
