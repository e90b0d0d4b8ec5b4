// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <charconv>
#include <concepts>
#include <optional>
#include <string_view>

/**
 * Parse a decimal integer which spans the whole string (no
 * whitespace, no sign for unsigned types).
 *
 * @return the value or std::nullopt on error (including overflow)
 */
template<std::integral T>
[[gnu::pure]]
std::optional<T>
ParseInteger(std::string_view s) noexcept
{
	T value;
	const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(),
					       value, 10);
	if (ec != std::errc{} || ptr == s.data() || ptr != s.data() + s.size())
		return std::nullopt;

	return value;
}
