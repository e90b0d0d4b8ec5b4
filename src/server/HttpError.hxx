// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "http/Status.hxx"

#include <stdexcept>
#include <string>

/**
 * A request cannot be handled; the message is sent to the client
 * with the given status.
 */
class HttpError : public std::runtime_error {
	HttpStatus status;

	/**
	 * For "405 Method Not Allowed": the value of the "Allow"
	 * response header.
	 */
	const char *allow = nullptr;

public:
	HttpError(HttpStatus _status, const char *_msg) noexcept
		:std::runtime_error(_msg), status(_status) {}

	HttpError(HttpStatus _status, const std::string &_msg) noexcept
		:std::runtime_error(_msg), status(_status) {}

	static HttpError MethodNotAllowed(const char *_allow) noexcept {
		HttpError e(HttpStatus::METHOD_NOT_ALLOWED,
			    "Method not allowed");
		e.allow = _allow;
		return e;
	}

	HttpStatus GetStatus() const noexcept {
		return status;
	}

	const char *GetAllow() const noexcept {
		return allow;
	}
};
