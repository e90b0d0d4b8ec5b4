// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "UniqueHandle.hxx"

#include <cassert>
#include <coroutine>
#include <exception>
#include <optional>
#include <utility>

namespace Co {

namespace detail {

template<typename R>
class promise_result_manager {
	std::optional<R> value;

public:
	template<typename U>
	void return_value(U &&_value) noexcept {
		value.emplace(std::forward<U>(_value));
	}

	decltype(auto) GetReturnValue() noexcept {
		/* control must not flow off the end of a non-void
		   coroutine */
		assert(value);

		return std::move(*value);
	}
};

template<>
class promise_result_manager<void> {
public:
	void return_void() noexcept {}
	void GetReturnValue() noexcept {}
};

} // namespace Co::detail

/**
 * A lazy coroutine task: it does not run until it is awaited, and
 * then it resumes the awaiting coroutine when it finishes.  Exceptions
 * thrown inside the task are rethrown into the awaiter.
 *
 * The #Task object owns the coroutine frame; destroying it cancels
 * the coroutine.
 */
template<typename T>
class Task {
public:
	class promise_type : public detail::promise_result_manager<T> {
		std::coroutine_handle<> continuation = std::noop_coroutine();

		std::exception_ptr error;

	public:
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
			[[nodiscard]]
			std::coroutine_handle<> await_suspend(std::coroutine_handle<PROMISE> coro) noexcept {
				/* symmetric transfer back to the awaiter */
				return coro.promise().continuation;
			}

			void await_resume() noexcept {
			}
		};

		[[nodiscard]]
		auto final_suspend() noexcept {
			return final_awaitable{};
		}

		[[nodiscard]]
		Task<T> get_return_object() noexcept {
			return Task<T>(std::coroutine_handle<promise_type>::from_promise(*this));
		}

		void unhandled_exception() noexcept {
			error = std::current_exception();
		}

		void SetContinuation(std::coroutine_handle<> _continuation) noexcept {
			assert(_continuation);

			continuation = _continuation;
		}

		decltype(auto) GetReturnValue() {
			if (error)
				std::rethrow_exception(std::move(error));

			return detail::promise_result_manager<T>::GetReturnValue();
		}
	};

private:
	UniqueHandle<promise_type> coroutine;

	[[nodiscard]]
	explicit Task(std::coroutine_handle<promise_type> _coroutine) noexcept
		:coroutine(_coroutine)
	{
	}

public:
	[[nodiscard]]
	Task() = default;

	bool IsDefined() const noexcept {
		return coroutine;
	}

	[[nodiscard]]
	auto operator co_await() const noexcept {
		struct Awaitable final {
			const std::coroutine_handle<promise_type> coroutine;

			[[nodiscard]]
			bool await_ready() const noexcept {
				return coroutine.done();
			}

			[[nodiscard]]
			std::coroutine_handle<> await_suspend(std::coroutine_handle<> continuation) noexcept {
				coroutine.promise().SetContinuation(continuation);
				return coroutine;
			}

			decltype(auto) await_resume() {
				return coroutine.promise().GetReturnValue();
			}
		};

		assert(coroutine);

		return Awaitable{coroutine.get()};
	}
};

} // namespace Co
