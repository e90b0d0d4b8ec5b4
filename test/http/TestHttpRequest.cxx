// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "http/server/Request.hxx"
#include "http/server/Error.hxx"

#include <gtest/gtest.h>

static HttpStatus
GetErrorStatus(std::string_view head)
{
	try {
		ParseHttpRequestHead(head);
		return HttpStatus{};
	} catch (const HttpProtocolError &e) {
		return e.GetStatus();
	}
}

TEST(HttpRequest, Basic)
{
	const auto request = ParseHttpRequestHead("GET /videos/stream/a.mp4?x=1 HTTP/1.1\r\n"
						  "Host: localhost\r\n"
						  "Range:  bytes=0-99 \r\n");
	EXPECT_EQ(request.method, HttpMethod::GET);
	EXPECT_EQ(request.uri, "/videos/stream/a.mp4?x=1");
	EXPECT_EQ(request.GetPath(), "/videos/stream/a.mp4");
	EXPECT_FALSE(request.http_1_0);
	EXPECT_EQ(request.content_length, 0u);

	const auto *range = request.GetHeader("RANGE");
	ASSERT_NE(range, nullptr);
	EXPECT_EQ(*range, "bytes=0-99");

	EXPECT_TRUE(request.IsKeepAlive());
	EXPECT_FALSE(request.ExpectsContinue());
}

TEST(HttpRequest, LeadingEmptyLines)
{
	const auto request = ParseHttpRequestHead("\r\n\r\nHEAD / HTTP/1.0\r\n");
	EXPECT_EQ(request.method, HttpMethod::HEAD);
	EXPECT_TRUE(request.http_1_0);
	EXPECT_FALSE(request.IsKeepAlive());
}

TEST(HttpRequest, KeepAlive)
{
	EXPECT_FALSE(ParseHttpRequestHead("GET / HTTP/1.1\r\n"
					  "Connection: close\r\n").IsKeepAlive());
	EXPECT_TRUE(ParseHttpRequestHead("GET / HTTP/1.0\r\n"
					 "Connection: Keep-Alive\r\n").IsKeepAlive());
}

TEST(HttpRequest, ContentLength)
{
	const auto request = ParseHttpRequestHead("POST /videos/finalize-upload HTTP/1.1\r\n"
						  "Content-Length: 42\r\n"
						  "content-length: 42\r\n"
						  "Expect: 100-continue\r\n");
	EXPECT_EQ(request.method, HttpMethod::POST);
	EXPECT_EQ(request.content_length, 42u);
	EXPECT_TRUE(request.ExpectsContinue());

	EXPECT_EQ(GetErrorStatus("POST / HTTP/1.1\r\n"
				 "Content-Length: 1\r\n"
				 "Content-Length: 2\r\n"),
		  HttpStatus::BAD_REQUEST);
	EXPECT_EQ(GetErrorStatus("POST / HTTP/1.1\r\n"
				 "Content-Length: -1\r\n"),
		  HttpStatus::BAD_REQUEST);
	EXPECT_EQ(GetErrorStatus("POST / HTTP/1.1\r\n"
				 "Content-Length: 1x\r\n"),
		  HttpStatus::BAD_REQUEST);
}

TEST(HttpRequest, UnknownMethod)
{
	EXPECT_EQ(ParseHttpRequestHead("FOO / HTTP/1.1\r\n").method,
		  HttpMethod::INVALID);
}

TEST(HttpRequest, Malformed)
{
	EXPECT_EQ(GetErrorStatus(""), HttpStatus::BAD_REQUEST);
	EXPECT_EQ(GetErrorStatus("GET\r\n"), HttpStatus::BAD_REQUEST);
	EXPECT_EQ(GetErrorStatus("GET /\r\n"), HttpStatus::BAD_REQUEST);
	EXPECT_EQ(GetErrorStatus("GET foo HTTP/1.1\r\n"), HttpStatus::BAD_REQUEST);
	EXPECT_EQ(GetErrorStatus("GET / FOO/1.1\r\n"), HttpStatus::BAD_REQUEST);
	EXPECT_EQ(GetErrorStatus("GET / HTTP/2.0\r\n"),
		  HttpStatus::HTTP_VERSION_NOT_SUPPORTED);
	EXPECT_EQ(GetErrorStatus("GET / HTTP/1.1\r\n"
				 "Host: a\r\n"
				 " folded\r\n"),
		  HttpStatus::BAD_REQUEST);
	EXPECT_EQ(GetErrorStatus("GET / HTTP/1.1\r\n"
				 "No Colon\r\n"),
		  HttpStatus::BAD_REQUEST);
	EXPECT_EQ(GetErrorStatus("GET / HTTP/1.1\r\n"
				 "Bad Name: x\r\n"),
		  HttpStatus::BAD_REQUEST);
}

TEST(HttpRequest, TransferEncoding)
{
	EXPECT_EQ(GetErrorStatus("POST / HTTP/1.1\r\n"
				 "Transfer-Encoding: chunked\r\n"),
		  HttpStatus::NOT_IMPLEMENTED);
}
