// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Request.hxx"
#include "http/Status.hxx"
#include "co/InvokeTask.hxx"
#include "co/Task.hxx"
#include "net/UniqueSocketDescriptor.hxx"
#include "util/IntrusiveList.hxx"

#include <exception>
#include <optional>
#include <string>

class EventLoop;
class HttpHeaderList;
class HttpServerHandler;
class HttpServerConnection;

class HttpServerConnectionHandler {
public:
	/**
	 * The connection has been closed.  The implementation is
	 * expected to destroy the object.
	 */
	virtual void OnHttpConnectionClosed(HttpServerConnection &connection) noexcept = 0;
};

/**
 * One HTTP/1.1 connection accepted by the server.  It processes
 * requests one after another in a coroutine.
 */
class HttpServerConnection final : public AutoUnlinkIntrusiveListHook {
	/**
	 * The maximum size of the request line plus all header
	 * lines.
	 */
	static constexpr std::size_t MAX_HEAD_SIZE = 8192;

	EventLoop &event_loop;

	const UniqueSocketDescriptor socket;

	HttpServerConnectionHandler &connection_handler;

	HttpServerHandler &handler;

	const HttpHeaderList &default_headers;

	/**
	 * Data received from the socket which has not been consumed
	 * yet.
	 */
	std::string input;

	Co::InvokeTask task;

public:
	HttpServerConnection(EventLoop &_event_loop,
			     UniqueSocketDescriptor &&_socket,
			     HttpServerConnectionHandler &_connection_handler,
			     HttpServerHandler &_handler,
			     const HttpHeaderList &_default_headers) noexcept;

	~HttpServerConnection() noexcept;

	HttpServerConnection(const HttpServerConnection &) = delete;
	HttpServerConnection &operator=(const HttpServerConnection &) = delete;

	void Start() noexcept;

private:
	/**
	 * Receive more data into #input.
	 *
	 * @return false if the peer has closed the connection
	 */
	Co::Task<bool> Fill();

	/**
	 * Receive the next request including its body.
	 *
	 * Throws #HttpProtocolError if the request is invalid.
	 *
	 * @return std::nullopt if the peer has closed the connection
	 * between two requests
	 */
	Co::Task<std::optional<HttpServerRequest>> ReadRequest();

	Co::Task<void> SendError(HttpStatus status, std::string_view message);

	Co::InvokeTask Run();

	void OnCompletion(std::exception_ptr error) noexcept;
};
