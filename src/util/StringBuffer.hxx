// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <array>
#include <cstddef>

/**
 * A statically allocated string buffer.
 */
template<std::size_t CAPACITY>
class StringBuffer {
	static_assert(CAPACITY > 0);

	std::array<char, CAPACITY> the_data;

public:
	using value_type = char;
	using pointer = char *;
	using const_pointer = const char *;
	using size_type = std::size_t;

	static constexpr size_type capacity() noexcept {
		return CAPACITY;
	}

	constexpr bool empty() const noexcept {
		return front() == 0;
	}

	constexpr void clear() noexcept {
		the_data[0] = 0;
	}

	constexpr const_pointer c_str() const noexcept {
		return the_data.data();
	}

	constexpr pointer data() noexcept {
		return the_data.data();
	}

	constexpr value_type front() const noexcept {
		return the_data.front();
	}

	constexpr operator const_pointer() const noexcept {
		return c_str();
	}
};
