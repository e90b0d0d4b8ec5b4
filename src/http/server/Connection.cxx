// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Connection.hxx"
#include "Error.hxx"
#include "Handler.hxx"
#include "Response.hxx"
#include "event/net/co/Socket.hxx"
#include "http/HeaderList.hxx"
#include "io/Logger.hxx"
#include "util/SpanCast.hxx"

#include <array>

static const LLogger logger{"http"};

HttpServerConnection::HttpServerConnection(EventLoop &_event_loop,
					   UniqueSocketDescriptor &&_socket,
					   HttpServerConnectionHandler &_connection_handler,
					   HttpServerHandler &_handler,
					   const HttpHeaderList &_default_headers) noexcept
	:event_loop(_event_loop), socket(std::move(_socket)),
	 connection_handler(_connection_handler), handler(_handler),
	 default_headers(_default_headers)
{
}

HttpServerConnection::~HttpServerConnection() noexcept = default;

void
HttpServerConnection::Start() noexcept
{
	task = Run();
	task.Start(BIND_THIS_METHOD(OnCompletion));
}

Co::Task<bool>
HttpServerConnection::Fill()
{
	std::array<std::byte, 16384> buffer;
	const std::size_t nbytes =
		co_await Co::ReceiveSome(event_loop, socket, buffer);
	if (nbytes == 0)
		co_return false;

	input.append(ToStringView(std::span{buffer}.first(nbytes)));
	co_return true;
}

Co::Task<std::optional<HttpServerRequest>>
HttpServerConnection::ReadRequest()
{
	std::size_t head_end;
	while ((head_end = input.find("\r\n\r\n")) == input.npos) {
		if (input.size() > MAX_HEAD_SIZE)
			throw HttpProtocolError(HttpStatus::REQUEST_HEADER_FIELDS_TOO_LARGE,
						"Request head too large");

		if (!co_await Fill()) {
			if (input.empty())
				co_return std::nullopt;

			throw SocketClosedPrematurelyError{};
		}
	}

	if (head_end > MAX_HEAD_SIZE)
		throw HttpProtocolError(HttpStatus::REQUEST_HEADER_FIELDS_TOO_LARGE,
					"Request head too large");

	auto request = ParseHttpRequestHead(std::string_view{input}.substr(0, head_end));
	input.erase(0, head_end + 4);

	if (const auto *expect = request.GetHeader("expect");
	    expect != nullptr && !request.ExpectsContinue())
		throw HttpProtocolError(HttpStatus::EXPECTATION_FAILED,
					"Unsupported expectation");

	if (request.content_length > handler.GetMaxRequestBody(request))
		throw HttpProtocolError(HttpStatus::REQUEST_ENTITY_TOO_LARGE,
					"Request body too large");

	if (request.content_length > 0 && request.ExpectsContinue() &&
	    input.empty() && !request.http_1_0)
		co_await Co::SendAll(event_loop, socket,
				     AsBytes("HTTP/1.1 100 Continue\r\n\r\n"));

	if (request.content_length > 0) {
		const std::size_t length = request.content_length;
		request.body.reserve(length);

		while (input.size() < length)
			if (!co_await Fill())
				throw SocketClosedPrematurelyError{};

		request.body.assign(input, 0, length);
		input.erase(0, length);
	}

	co_return request;
}

Co::Task<void>
HttpServerConnection::SendError(HttpStatus status, std::string_view message)
{
	HttpServerResponse response(event_loop, socket, default_headers, false);

	HttpHeaderList headers;
	headers.Add("content-type", "text/plain");

	const std::string body = std::string{message} + "\n";
	co_await response.SendResponse(status, headers, body);
}

Co::InvokeTask
HttpServerConnection::Run()
{
	bool keep_alive = true;

	while (keep_alive) {
		std::optional<HttpServerRequest> request;
		HttpStatus error_status = HttpStatus::UNDEFINED;
		std::string error_message;

		try {
			request = co_await ReadRequest();
		} catch (const HttpProtocolError &e) {
			error_status = e.GetStatus();
			error_message = e.what();
		}

		if (error_status != HttpStatus::UNDEFINED) {
			logger.Fmt(2, "bad request: {}", error_message);
			co_await SendError(error_status, error_message);
			break;
		}

		if (!request)
			break;

		HttpServerResponse response(event_loop, socket,
					    default_headers,
					    request->IsKeepAlive());
		co_await handler.HandleHttpRequest(*request, response);

		if (!response.IsHeadSent()) {
			logger(1, "request handler did not send a response");
			co_await SendError(HttpStatus::INTERNAL_SERVER_ERROR,
					   "Internal server error");
			break;
		}

		keep_alive = response.IsKeepAlive();
	}
}

void
HttpServerConnection::OnCompletion(std::exception_ptr error) noexcept
{
	if (error)
		logger(2, error);

	connection_handler.OnHttpConnectionClosed(*this);
}
