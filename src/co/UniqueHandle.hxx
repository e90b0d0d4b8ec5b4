// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <coroutine>
#include <utility>

namespace Co {

/**
 * Owner of a std::coroutine_handle; the destructor destroys the
 * coroutine frame.
 */
template<typename Promise=void>
class UniqueHandle {
	std::coroutine_handle<Promise> value;

public:
	UniqueHandle() = default;

	explicit constexpr UniqueHandle(std::coroutine_handle<Promise> h) noexcept
		:value(h) {}

	UniqueHandle(UniqueHandle &&src) noexcept
		:value(std::exchange(src.value, nullptr)) {}

	~UniqueHandle() noexcept {
		if (value)
			value.destroy();
	}

	UniqueHandle &operator=(UniqueHandle &&src) noexcept {
		using std::swap;
		swap(value, src.value);
		return *this;
	}

	operator bool() const noexcept {
		return (bool)value;
	}

	const auto &get() const noexcept {
		return value;
	}

	auto release() noexcept {
		return std::exchange(value, nullptr);
	}
};

} // namespace Co
