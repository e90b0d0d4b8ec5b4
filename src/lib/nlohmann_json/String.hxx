// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "util/NumberParser.hxx"

#include <nlohmann/json.hpp>

#include <concepts>
#include <cstdint>
#include <limits>
#include <optional>
#include <string_view>

namespace Json {

/**
 * Look up a string member of an object.
 *
 * @return the value or an empty string if the member does not exist
 * or is not a string
 */
[[gnu::pure]]
inline std::string_view
GetStringRobust(const nlohmann::json &j, std::string_view key) noexcept
{
	if (const auto i = j.find(key); i != j.end() && i->is_string())
		return i->get_ref<const std::string &>();
	else
		return {};
}

/**
 * Look up an unsigned integer member of an object.  It may be a JSON
 * number or a string containing a decimal number.
 *
 * @return the value or std::nullopt if the member does not exist or
 * is not a valid unsigned integer of type #T
 */
template<std::unsigned_integral T>
[[gnu::pure]]
std::optional<T>
GetUnsignedRobust(const nlohmann::json &j, std::string_view key) noexcept
{
	const auto i = j.find(key);
	if (i == j.end())
		return std::nullopt;

	if (i->is_number_unsigned()) {
		const auto value = i->get<uint64_t>();
		if (value > std::numeric_limits<T>::max())
			return std::nullopt;
		return static_cast<T>(value);
	}

	if (i->is_string())
		return ParseInteger<T>(i->get_ref<const std::string &>());

	return std::nullopt;
}

} // namespace Json
