// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

enum class HttpMethod : uint_least8_t {
	/**
	 * Not an actual HTTP method, but a "magic" value which means
	 * a variable explicitly has no value.
	 */
	UNDEFINED = 0,

	HEAD,
	GET,
	POST,
	PUT,
	DELETE,
	OPTIONS,

	/**
	 * A method which is syntactically valid, but not known to
	 * this server.
	 */
	INVALID,
};

constexpr const char *http_method_to_string_data[] = {
	nullptr,

	"HEAD",
	"GET",
	"POST",
	"PUT",
	"DELETE",
	"OPTIONS",

	nullptr,
};

[[gnu::const]]
static constexpr const char *
http_method_to_string(HttpMethod method) noexcept
{
	return http_method_to_string_data[static_cast<std::size_t>(method)];
}

[[gnu::pure]]
static constexpr HttpMethod
http_method_from_string(std::string_view s) noexcept
{
	for (std::size_t i = 1; http_method_to_string_data[i] != nullptr; ++i)
		if (s == http_method_to_string_data[i])
			return static_cast<HttpMethod>(i);

	return HttpMethod::INVALID;
}
