// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "co/Task.hxx"
#include "http/Status.hxx"

#include <cstddef>
#include <span>

class HttpHeaderList;

/**
 * The destination of a #MediaStreamer, usually an HTTP response.
 *
 * If the peer has gone away, the methods throw
 * #SocketClosedPrematurelyError.
 */
class StreamSink {
public:
	virtual ~StreamSink() noexcept = default;

	/**
	 * Send the status line and the header block.  This is called
	 * at most once, before any body data.
	 */
	virtual Co::Task<void> SendHead(HttpStatus status,
					const HttpHeaderList &headers) = 0;

	/**
	 * Send a piece of the body.  The coroutine finishes as soon
	 * as the buffer has been consumed; the caller may then reuse
	 * it.
	 */
	virtual Co::Task<void> SendBody(std::span<const std::byte> src) = 0;

	/**
	 * The body cannot be completed (after SendHead() has been
	 * called).  The sink must terminate the transfer in a way the
	 * peer recognizes as incomplete.
	 */
	virtual void Abort() noexcept = 0;
};
