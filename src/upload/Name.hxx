// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <chrono>
#include <string>
#include <string_view>

/**
 * Replace all characters which are not ASCII letters, digits, dots,
 * underscores or dashes with an underscore.  Leading and trailing
 * whitespace is removed first.
 */
std::string
SanitizeFilename(std::string_view src) noexcept;

/**
 * Generate the name under which an upload is stored:
 * "<unix-ms>_<sanitized>".
 */
std::string
MakeStorageName(std::string_view sanitized,
		std::chrono::system_clock::time_point now) noexcept;

/**
 * Does the filename end with one of the accepted video extensions
 * (".mp4", ".avi", ".mov", ".mkv", ".webm"; case-insensitive)?
 */
[[gnu::pure]]
bool
HasVideoExtension(std::string_view filename) noexcept;
