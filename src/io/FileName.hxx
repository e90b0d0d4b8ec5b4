// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <string_view>

/**
 * Is this "." or ".."?
 */
[[gnu::pure]]
constexpr bool
IsSpecialFilename(std::string_view s) noexcept
{
	return s == "." || s == "..";
}

/**
 * Can this string be used as a plain file name inside a directory,
 * i.e. without escaping it?  It must not be empty, must not contain
 * slashes or null bytes and must not be "." or "..".
 */
[[gnu::pure]]
constexpr bool
IsPlainFilename(std::string_view s) noexcept
{
	return !s.empty() && !IsSpecialFilename(s) &&
		s.find('/') == s.npos &&
		s.find('\0') == s.npos;
}
