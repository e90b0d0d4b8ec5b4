// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <string_view>

/**
 * Skips whitespace at the beginning of the string, and returns the
 * first non-whitespace character.  If the string has no
 * non-whitespace characters, then a pointer to the NULL terminator
 * is returned.
 */
[[gnu::pure]] [[gnu::returns_nonnull]] [[gnu::nonnull]]
const char *
StripLeft(const char *p) noexcept;

[[gnu::pure]] [[gnu::returns_nonnull]] [[gnu::nonnull]]
static inline char *
StripLeft(char *p) noexcept
{
	return const_cast<char *>(StripLeft((const char *)p));
}

[[gnu::pure]]
std::string_view
StripLeft(std::string_view s) noexcept;

/**
 * Strips trailing whitespace by writing a NULL byte.
 */
[[gnu::nonnull]]
void
StripRight(char *p) noexcept;

[[gnu::pure]]
std::string_view
StripRight(std::string_view s) noexcept;

[[gnu::pure]]
std::string_view
Strip(std::string_view s) noexcept;
