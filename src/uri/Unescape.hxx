// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <optional>
#include <string>
#include <string_view>

/**
 * Decode "%XX" escape sequences in a URI path segment.
 *
 * @return the decoded string or std::nullopt if the input contains
 * a malformed escape sequence or an escaped null byte
 */
std::optional<std::string>
UriUnescape(std::string_view src);
