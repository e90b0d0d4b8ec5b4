// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <coroutine>

namespace Co {

/**
 * Glue for a class which wants to be awaitable.  The class must have
 * the following members:
 *
 * - `std::coroutine_handle<> continuation` (to be resumed by the
 *   class when the operation completes)
 * - `bool IsReady() const noexcept`
 * - `TakeValue()` (returns the result or throws)
 *
 * The helper must be declared a friend of that class.
 */
template<typename T>
class AwaitableHelper {
	T &t;

public:
	constexpr AwaitableHelper(T &_t) noexcept:t(_t) {}

	[[nodiscard]]
	bool await_ready() const noexcept {
		return t.IsReady();
	}

	void await_suspend(std::coroutine_handle<> _continuation) noexcept {
		t.continuation = _continuation;
	}

	decltype(auto) await_resume() {
		return t.TakeValue();
	}
};

} // namespace Co
