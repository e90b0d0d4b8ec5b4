// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstddef>
#include <span>
#include <string_view>

/**
 * Cast a std::span<std::byte> to a std::string_view.
 */
inline std::string_view
ToStringView(std::span<const std::byte> s) noexcept
{
	return {reinterpret_cast<const char *>(s.data()), s.size()};
}

inline std::span<const std::byte>
AsBytes(std::string_view s) noexcept
{
	return std::as_bytes(std::span{s});
}
