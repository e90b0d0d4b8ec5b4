// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Request.hxx"
#include "Error.hxx"
#include "util/StringCompare.hxx"
#include "util/StringStrip.hxx"

#include <charconv>

bool
HttpServerRequest::IsKeepAlive() const noexcept
{
	const auto *connection = headers.Find("connection");

	if (http_1_0)
		return connection != nullptr &&
			StringIsEqualIgnoreCase(Strip(*connection), "keep-alive");

	return connection == nullptr ||
		!StringIsEqualIgnoreCase(Strip(*connection), "close");
}

bool
HttpServerRequest::ExpectsContinue() const noexcept
{
	const auto *expect = headers.Find("expect");
	return expect != nullptr &&
		StringIsEqualIgnoreCase(Strip(*expect), "100-continue");
}

static std::string_view
NextLine(std::string_view &head) noexcept
{
	std::string_view line;
	if (const auto eol = head.find('\n'); eol != head.npos) {
		line = head.substr(0, eol);
		head = head.substr(eol + 1);
	} else {
		line = head;
		head = {};
	}

	if (line.ends_with('\r'))
		line.remove_suffix(1);

	return line;
}

static constexpr bool
IsTokenChar(char ch) noexcept
{
	return ch > 0x20 && ch < 0x7f && ch != ':';
}

static void
ParseRequestLine(HttpServerRequest &request, std::string_view line)
{
	const auto space1 = line.find(' ');
	if (space1 == line.npos || space1 == 0)
		throw HttpProtocolError(HttpStatus::BAD_REQUEST,
					"Malformed request line");

	request.method = http_method_from_string(line.substr(0, space1));
	line = line.substr(space1 + 1);

	const auto space2 = line.rfind(' ');
	if (space2 == line.npos || space2 == 0)
		throw HttpProtocolError(HttpStatus::BAD_REQUEST,
					"Malformed request line");

	const auto uri = line.substr(0, space2);
	const auto version = line.substr(space2 + 1);

	if (uri.front() != '/' && uri != "*")
		throw HttpProtocolError(HttpStatus::BAD_REQUEST,
					"Malformed request URI");

	if (uri.find(' ') != uri.npos)
		throw HttpProtocolError(HttpStatus::BAD_REQUEST,
					"Malformed request line");

	request.uri = uri;

	if (version == "HTTP/1.1")
		request.http_1_0 = false;
	else if (version == "HTTP/1.0")
		request.http_1_0 = true;
	else if (version.starts_with("HTTP/"))
		throw HttpProtocolError(HttpStatus::HTTP_VERSION_NOT_SUPPORTED,
					"Unsupported HTTP version");
	else
		throw HttpProtocolError(HttpStatus::BAD_REQUEST,
					"Malformed request line");
}

static void
ParseHeaderLine(HttpServerRequest &request, std::string_view line)
{
	if (line.front() == ' ' || line.front() == '\t')
		/* obsolete line folding */
		throw HttpProtocolError(HttpStatus::BAD_REQUEST,
					"Folded header line");

	const auto colon = line.find(':');
	if (colon == line.npos || colon == 0)
		throw HttpProtocolError(HttpStatus::BAD_REQUEST,
					"Malformed header line");

	const auto name = line.substr(0, colon);
	for (const char ch : name)
		if (!IsTokenChar(ch))
			throw HttpProtocolError(HttpStatus::BAD_REQUEST,
						"Malformed header name");

	request.headers.Add(name, Strip(line.substr(colon + 1)));
}

static uint64_t
ParseContentLength(std::string_view s)
{
	s = Strip(s);

	uint64_t value;
	const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(),
					       value, 10);
	if (ec != std::errc{} || ptr != s.data() + s.size() || s.empty())
		throw HttpProtocolError(HttpStatus::BAD_REQUEST,
					"Malformed Content-Length");

	return value;
}

HttpServerRequest
ParseHttpRequestHead(std::string_view head)
{
	HttpServerRequest request;

	/* RFC 9112 2.2: ignore empty lines before the request line */
	std::string_view line;
	do {
		if (head.empty())
			throw HttpProtocolError(HttpStatus::BAD_REQUEST,
						"Empty request");

		line = NextLine(head);
	} while (line.empty());

	ParseRequestLine(request, line);

	while (!head.empty()) {
		line = NextLine(head);
		if (line.empty())
			break;

		ParseHeaderLine(request, line);
	}

	if (request.headers.Contains("transfer-encoding"))
		throw HttpProtocolError(HttpStatus::NOT_IMPLEMENTED,
					"Transfer-Encoding is not supported");

	bool have_length = false;
	for (const auto &[name, value] : request.headers) {
		if (!StringIsEqualIgnoreCase(name, "content-length"))
			continue;

		const auto length = ParseContentLength(value);
		if (have_length && length != request.content_length)
			throw HttpProtocolError(HttpStatus::BAD_REQUEST,
						"Conflicting Content-Length headers");

		request.content_length = length;
		have_length = true;
	}

	return request;
}
