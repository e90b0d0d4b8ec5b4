// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "http/Multipart.hxx"

#include <gtest/gtest.h>

using std::string_view_literals::operator""sv;

TEST(Multipart, Boundary)
{
	EXPECT_EQ(GetMultipartBoundary("multipart/form-data; boundary=abc"), "abc"sv);
	EXPECT_EQ(GetMultipartBoundary("Multipart/Form-Data;boundary=\"a b\""), "a b"sv);
	EXPECT_EQ(GetMultipartBoundary("multipart/form-data; charset=utf-8; boundary=x"), "x"sv);
	EXPECT_TRUE(GetMultipartBoundary("multipart/form-data").empty());
	EXPECT_TRUE(GetMultipartBoundary("application/json").empty());
	EXPECT_TRUE(GetMultipartBoundary("multipart/mixed; boundary=abc").empty());
}

TEST(Multipart, Parse)
{
	constexpr auto body =
		"preamble\r\n"
		"--XyZ\r\n"
		"Content-Disposition: form-data; name=\"chunkNumber\"\r\n"
		"\r\n"
		"3\r\n"
		"--XyZ\r\n"
		"Content-Disposition: form-data; name=\"chunk\"; filename=\"a;b.mp4\"\r\n"
		"Content-Type: application/octet-stream\r\n"
		"\r\n"
		"\x00\x01\r\n--X\r\n"
		"--XyZ--\r\n"
		"epilogue"sv;

	const auto parts = ParseMultipart(body, "XyZ");
	ASSERT_EQ(parts.size(), 2u);

	EXPECT_EQ(parts[0].name, "chunkNumber");
	EXPECT_FALSE(parts[0].has_filename);
	EXPECT_EQ(parts[0].value, "3"sv);

	EXPECT_EQ(parts[1].name, "chunk");
	EXPECT_TRUE(parts[1].has_filename);
	EXPECT_EQ(parts[1].filename, "a;b.mp4");
	EXPECT_EQ(parts[1].content_type, "application/octet-stream");
	EXPECT_EQ(parts[1].value, "\x00\x01\r\n--X"sv);

	const auto *p = FindMultipartPart(parts, "chunk");
	ASSERT_NE(p, nullptr);
	EXPECT_EQ(p, &parts[1]);
	EXPECT_EQ(FindMultipartPart(parts, "totalChunks"), nullptr);
}

TEST(Multipart, EmptyValue)
{
	constexpr auto body =
		"--b\r\n"
		"Content-Disposition: form-data; name=\"x\"\r\n"
		"\r\n"
		"\r\n"
		"--b--"sv;

	const auto parts = ParseMultipart(body, "b");
	ASSERT_EQ(parts.size(), 1u);
	EXPECT_TRUE(parts[0].value.empty());
}

TEST(Multipart, Malformed)
{
	EXPECT_THROW(ParseMultipart("--b\r\n\r\nfoo", ""), MultipartError);

	/* boundary not found */
	EXPECT_THROW(ParseMultipart("hello world", "b"), MultipartError);

	/* truncated */
	EXPECT_THROW(ParseMultipart("--b\r\n"
				    "Content-Disposition: form-data; name=\"x\"\r\n"
				    "\r\n"
				    "value", "b"),
		     MultipartError);

	/* part header without colon */
	EXPECT_THROW(ParseMultipart("--b\r\n"
				    "garbage\r\n"
				    "\r\n"
				    "value\r\n--b--", "b"),
		     MultipartError);

	/* part without a name */
	EXPECT_THROW(ParseMultipart("--b\r\n"
				    "Content-Disposition: form-data\r\n"
				    "\r\n"
				    "value\r\n--b--", "b"),
		     MultipartError);
}
