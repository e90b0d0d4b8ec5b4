// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "stream/Sink.hxx"
#include "net/SocketDescriptor.hxx"

#include <cstddef>
#include <string_view>

class EventLoop;
class HttpHeaderList;

/**
 * Writes one HTTP/1.1 response to a connection socket.
 */
class HttpServerResponse final : public StreamSink {
	EventLoop &event_loop;

	const SocketDescriptor socket;

	/**
	 * Headers which are added to every response (e.g. CORS).
	 */
	const HttpHeaderList &default_headers;

	HttpStatus status = HttpStatus::UNDEFINED;

	/**
	 * The number of body bytes sent since the last time we
	 * yielded to the event loop.
	 */
	std::size_t unyielded = 0;

	bool keep_alive;

	bool aborted = false;

public:
	HttpServerResponse(EventLoop &_event_loop, SocketDescriptor _socket,
			   const HttpHeaderList &_default_headers,
			   bool _keep_alive) noexcept
		:event_loop(_event_loop), socket(_socket),
		 default_headers(_default_headers),
		 keep_alive(_keep_alive) {}

	bool IsHeadSent() const noexcept {
		return status != HttpStatus::UNDEFINED;
	}

	HttpStatus GetStatus() const noexcept {
		return status;
	}

	bool IsKeepAlive() const noexcept {
		return keep_alive;
	}

	/**
	 * Send a complete response with a "Content-Length" header.
	 *
	 * @param send_body false to omit the body (for "HEAD"
	 * requests); "Content-Length" is still the size of #body
	 */
	Co::Task<void> SendResponse(HttpStatus status,
				    const HttpHeaderList &headers,
				    std::string_view body,
				    bool send_body=true);

	/* virtual methods from class StreamSink */
	Co::Task<void> SendHead(HttpStatus status,
				const HttpHeaderList &headers) override;
	Co::Task<void> SendBody(std::span<const std::byte> src) override;
	void Abort() noexcept override;
};
