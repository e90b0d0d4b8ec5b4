// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "co/Task.hxx"

#include <cstdint>

struct HttpServerRequest;
class HttpServerResponse;

class HttpServerHandler {
public:
	/**
	 * Determine the maximum request body size accepted for the
	 * given request (whose body has not been received yet).
	 * Larger requests are rejected with "413 Request Entity Too
	 * Large".
	 */
	[[gnu::pure]]
	virtual uint64_t GetMaxRequestBody(const HttpServerRequest &request) const noexcept = 0;

	/**
	 * Handle a request whose body has been received completely.
	 * The coroutine must send a response before it finishes.
	 * Exceptions close the connection.
	 */
	virtual Co::Task<void> HandleHttpRequest(HttpServerRequest &request,
						 HttpServerResponse &response) = 0;
};
