// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "net/SocketProtocolError.hxx"
#include "http/Status.hxx"

/**
 * The client has sent a request which cannot be processed.  The
 * connection replies with the given status and then closes.
 */
class HttpProtocolError : public SocketProtocolError {
	HttpStatus status;

public:
	HttpProtocolError(HttpStatus _status, const char *_msg) noexcept
		:SocketProtocolError(_msg), status(_status) {}

	HttpStatus GetStatus() const noexcept {
		return status;
	}
};
