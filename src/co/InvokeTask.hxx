// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "util/BindMethod.hxx"

#include <cassert>
#include <coroutine>
#include <exception>
#include <utility>

namespace Co {

/**
 * A coroutine task which can be launched from synchronous code.  It
 * is suspended initially; Start() runs it until its first
 * suspension point, and the callback is invoked when it finishes.
 *
 * Destroying the #InvokeTask cancels the coroutine.  It is allowed
 * to destroy it from inside the completion callback.
 */
class InvokeTask {
public:
	using Callback = BoundMethod<void(std::exception_ptr error) noexcept>;

	struct promise_type {
		Callback callback{nullptr};

		std::exception_ptr error;

		[[nodiscard]]
		auto initial_suspend() noexcept {
			return std::suspend_always{};
		}

		struct final_awaitable {
			[[nodiscard]]
			bool await_ready() const noexcept {
				return false;
			}

			template<typename PROMISE>
			void await_suspend(std::coroutine_handle<PROMISE> coro) noexcept {
				auto &p = coro.promise();
				assert(p.callback);

				/* the callback may destroy this coroutine
				   frame, so it must be the last access */
				p.callback(std::move(p.error));
			}

			void await_resume() const noexcept {
			}
		};

		[[nodiscard]]
		auto final_suspend() noexcept {
			return final_awaitable{};
		}

		void return_void() noexcept {
		}

		[[nodiscard]]
		InvokeTask get_return_object() noexcept {
			return InvokeTask(std::coroutine_handle<promise_type>::from_promise(*this));
		}

		void unhandled_exception() noexcept {
			error = std::current_exception();
		}
	};

private:
	std::coroutine_handle<promise_type> coroutine;

	[[nodiscard]]
	explicit InvokeTask(std::coroutine_handle<promise_type> _coroutine) noexcept
		:coroutine(_coroutine)
	{
	}

public:
	[[nodiscard]]
	InvokeTask() = default;

	InvokeTask(InvokeTask &&src) noexcept
		:coroutine(std::exchange(src.coroutine, nullptr))
	{
	}

	~InvokeTask() noexcept {
		if (coroutine)
			coroutine.destroy();
	}

	InvokeTask &operator=(InvokeTask &&src) noexcept {
		using std::swap;
		swap(coroutine, src.coroutine);
		return *this;
	}

	operator bool() const noexcept {
		return (bool)coroutine;
	}

	/**
	 * Run the coroutine until its first suspension point.  The
	 * given callback is invoked when it finishes (which may happen
	 * before this method returns).
	 */
	void Start(Callback callback) noexcept {
		assert(coroutine);
		assert(!coroutine.done());
		assert(!coroutine.promise().callback);
		assert(callback);

		coroutine.promise().callback = callback;
		coroutine.resume();
	}
};

} // namespace Co
