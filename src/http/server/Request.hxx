// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "http/HeaderList.hxx"
#include "http/Method.hxx"

#include <cstdint>
#include <string>
#include <string_view>

struct HttpServerRequest {
	HttpMethod method = HttpMethod::UNDEFINED;

	/**
	 * The request URI as sent by the client.
	 */
	std::string uri;

	bool http_1_0 = false;

	HttpHeaderList headers;

	/**
	 * The value of the "Content-Length" header (0 if there is
	 * none).
	 */
	uint64_t content_length = 0;

	std::string body;

	/**
	 * The URI path without the query string.
	 */
	[[gnu::pure]]
	std::string_view GetPath() const noexcept {
		std::string_view path = uri;
		if (const auto q = path.find('?'); q != path.npos)
			path = path.substr(0, q);
		return path;
	}

	[[gnu::pure]]
	const std::string *GetHeader(std::string_view name) const noexcept {
		return headers.Find(name);
	}

	/**
	 * Does the client want to keep the connection open after this
	 * request?
	 */
	[[gnu::pure]]
	bool IsKeepAlive() const noexcept;

	/**
	 * Has the client sent "Expect: 100-continue"?
	 */
	[[gnu::pure]]
	bool ExpectsContinue() const noexcept;
};

/**
 * Parse the request line and the header block (without the empty
 * line at the end).  Transfer encodings are rejected.
 *
 * Throws #HttpProtocolError on error.
 */
HttpServerRequest
ParseHttpRequestHead(std::string_view head);
