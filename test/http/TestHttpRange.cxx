// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "http/Range.hxx"

#include <gtest/gtest.h>

static HttpRangeRequest
Parse(uint64_t size, std::string_view value) noexcept
{
	HttpRangeRequest range(size);
	range.ParseRangeHeader(value);
	return range;
}

TEST(HttpRange, None)
{
	const HttpRangeRequest range(1000);
	EXPECT_EQ(range.type, HttpRangeRequest::Type::NONE);
	EXPECT_FALSE(range.IsPartial());
}

TEST(HttpRange, Valid)
{
	auto range = Parse(1000, "bytes=200-499");
	EXPECT_EQ(range.type, HttpRangeRequest::Type::VALID);
	EXPECT_TRUE(range.IsPartial());
	EXPECT_EQ(range.start, 200u);
	EXPECT_EQ(range.end, 499u);
	EXPECT_EQ(range.GetLength(), 300u);

	range = Parse(1000, "bytes=0-0");
	EXPECT_EQ(range.type, HttpRangeRequest::Type::VALID);
	EXPECT_EQ(range.GetLength(), 1u);

	range = Parse(1000, "bytes=999-999");
	EXPECT_EQ(range.type, HttpRangeRequest::Type::VALID);
	EXPECT_EQ(range.GetLength(), 1u);

	range = Parse(1000, "  bytes=10-20 ");
	EXPECT_EQ(range.type, HttpRangeRequest::Type::VALID);
	EXPECT_EQ(range.start, 10u);
	EXPECT_EQ(range.end, 20u);
}

TEST(HttpRange, OpenEnded)
{
	auto range = Parse(1000, "bytes=100-");
	EXPECT_EQ(range.type, HttpRangeRequest::Type::VALID);
	EXPECT_EQ(range.start, 100u);
	EXPECT_EQ(range.end, 999u);
	EXPECT_EQ(range.GetLength(), 900u);

	range = Parse(1000, "bytes=0-");
	EXPECT_EQ(range.type, HttpRangeRequest::Type::VALID);
	EXPECT_EQ(range.GetLength(), 1000u);
}

TEST(HttpRange, Unsatisfiable)
{
	auto range = Parse(1000, "bytes=900-1500");
	EXPECT_EQ(range.type, HttpRangeRequest::Type::UNSATISFIABLE);
	EXPECT_EQ(range.start, 900u);
	EXPECT_EQ(range.end, 1500u);

	range = Parse(1000, "bytes=1000-1000");
	EXPECT_EQ(range.type, HttpRangeRequest::Type::UNSATISFIABLE);

	range = Parse(1000, "bytes=1000-");
	EXPECT_EQ(range.type, HttpRangeRequest::Type::UNSATISFIABLE);

	range = Parse(1000, "bytes=0-1000");
	EXPECT_EQ(range.type, HttpRangeRequest::Type::UNSATISFIABLE);
}

TEST(HttpRange, EmptyFile)
{
	EXPECT_EQ(Parse(0, "bytes=0-").type,
		  HttpRangeRequest::Type::UNSATISFIABLE);
	EXPECT_EQ(Parse(0, "bytes=0-0").type,
		  HttpRangeRequest::Type::UNSATISFIABLE);
}

TEST(HttpRange, Malformed)
{
	static constexpr const char *values[] = {
		"",
		"bytes",
		"bytes=",
		"bytes=-",
		"bytes=-500",
		"bytes=abc-def",
		"bytes=10-abc",
		"bytes=10-20x",
		"bytes=10-20,30-40",
		"bytes=20-10",
		"bytes=+10-20",
		"bytes=10--20",
		"items=0-10",
		"0-10",
		"bytes=99999999999999999999999-",
	};

	for (const char *value : values)
		EXPECT_EQ(Parse(1000, value).type,
			  HttpRangeRequest::Type::MALFORMED) << value;
}

TEST(HttpRange, MalformedBeforeUnsatisfiable)
{
	/* start>end is malformed even if both are out of range */
	EXPECT_EQ(Parse(1000, "bytes=2000-1500").type,
		  HttpRangeRequest::Type::MALFORMED);
}
