// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Response.hxx"
#include "event/co/Yield.hxx"
#include "event/net/co/Socket.hxx"
#include "http/HeaderList.hxx"
#include "util/SpanCast.hxx"

#include <fmt/format.h>

#include <cassert>
#include <iterator>

/**
 * After this many body bytes, give other connections a chance to
 * run even if our socket never blocks.
 */
static constexpr std::size_t YIELD_THRESHOLD = 1024 * 1024;

static void
AppendHeaders(fmt::memory_buffer &b, const HttpHeaderList &headers)
{
	for (const auto &[name, value] : headers)
		fmt::format_to(std::back_inserter(b), "{}: {}\r\n", name, value);
}

Co::Task<void>
HttpServerResponse::SendHead(HttpStatus _status, const HttpHeaderList &headers)
{
	assert(!IsHeadSent());
	assert(_status != HttpStatus::UNDEFINED);

	status = _status;

	const char *status_string = http_status_to_string(status);
	if (status_string == nullptr)
		status_string = "500 Internal Server Error";

	fmt::memory_buffer b;
	fmt::format_to(std::back_inserter(b), "HTTP/1.1 {}\r\n", status_string);
	AppendHeaders(b, default_headers);
	AppendHeaders(b, headers);
	fmt::format_to(std::back_inserter(b), "connection: {}\r\n\r\n",
		       keep_alive ? "keep-alive" : "close");

	co_await Co::SendAll(event_loop, socket,
			     AsBytes(std::string_view{b.data(), b.size()}));
}

Co::Task<void>
HttpServerResponse::SendBody(std::span<const std::byte> src)
{
	assert(IsHeadSent());
	assert(!aborted);

	co_await Co::SendAll(event_loop, socket, src);

	unyielded += src.size();
	if (unyielded >= YIELD_THRESHOLD) {
		unyielded = 0;
		co_await Co::Yield{event_loop};
	}
}

void
HttpServerResponse::Abort() noexcept
{
	/* the connection will be closed before the announced
	   Content-Length has been sent, which tells the client that
	   the body is incomplete */
	aborted = true;
	keep_alive = false;
}

Co::Task<void>
HttpServerResponse::SendResponse(HttpStatus _status,
				 const HttpHeaderList &headers,
				 std::string_view body, bool send_body)
{
	HttpHeaderList h = headers;
	if (!http_status_is_empty(_status))
		h.Set("content-length", fmt::format_int{body.size()}.c_str());

	co_await SendHead(_status, h);

	if (send_body && !body.empty() && !http_status_is_empty(_status))
		co_await SendBody(AsBytes(body));
}
