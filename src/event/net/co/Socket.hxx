// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "co/Task.hxx"

#include <cstddef>
#include <span>

class EventLoop;
class SocketDescriptor;

namespace Co {

/**
 * Receive data from a non-blocking socket, suspending until at least
 * one byte is available.
 *
 * Throws on error.
 *
 * @return the number of bytes received; 0 means the peer has closed
 * the connection
 */
Task<std::size_t>
ReceiveSome(EventLoop &event_loop, SocketDescriptor s,
	    std::span<std::byte> dest);

/**
 * Send all of the given data to a non-blocking socket, suspending
 * whenever the socket buffer is full.
 *
 * Throws #SocketClosedPrematurelyError if the peer has closed the
 * connection, std::system_error on other errors.
 */
Task<void>
SendAll(EventLoop &event_loop, SocketDescriptor s,
	std::span<const std::byte> src);

} // namespace Co
