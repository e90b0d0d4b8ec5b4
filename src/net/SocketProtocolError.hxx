// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <stdexcept>

/**
 * The peer has violated the protocol spoken on a socket.
 */
class SocketProtocolError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

/**
 * The peer has closed (or reset) the connection before the exchange
 * was complete.  For a streaming response, this is not an error of
 * ours; callers usually just log it.
 */
class SocketClosedPrematurelyError : public SocketProtocolError {
public:
	using SocketProtocolError::SocketProtocolError;

	SocketClosedPrematurelyError() noexcept
		:SocketProtocolError("Peer closed the socket prematurely") {}
};
