// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstdint>

/**
 * The HTTP status codes this server emits.
 */
enum class HttpStatus : uint_least16_t {
	/**
	 * Not an actual HTTP status code, but a "magic" value which
	 * means this status has no value.  This can be used as an
	 * initializer.
	 */
	UNDEFINED = 0,

	CONTINUE = 100,

	OK = 200,
	NO_CONTENT = 204,
	PARTIAL_CONTENT = 206,

	BAD_REQUEST = 400,
	NOT_FOUND = 404,
	METHOD_NOT_ALLOWED = 405,
	REQUEST_TIMEOUT = 408,
	CONFLICT = 409,
	LENGTH_REQUIRED = 411,
	REQUEST_ENTITY_TOO_LARGE = 413,
	REQUESTED_RANGE_NOT_SATISFIABLE = 416,
	EXPECTATION_FAILED = 417,

	/**
	 * @see RFC 4918 (WebDAV)
	 */
	UNPROCESSABLE_ENTITY = 422,

	/**
	 * @see RFC 6585 (Additional HTTP Status Codes)
	 */
	REQUEST_HEADER_FIELDS_TOO_LARGE = 431,

	INTERNAL_SERVER_ERROR = 500,
	NOT_IMPLEMENTED = 501,
	HTTP_VERSION_NOT_SUPPORTED = 505,
};

/**
 * Returns the status line text (e.g. "404 Not Found"), or nullptr if
 * the status is not known.
 */
[[gnu::const]]
const char *
http_status_to_string(HttpStatus status) noexcept;

/**
 * Does a response with this status never have a body?
 */
static constexpr bool
http_status_is_empty(HttpStatus status) noexcept
{
	return status == HttpStatus::CONTINUE ||
		status == HttpStatus::NO_CONTENT;
}
