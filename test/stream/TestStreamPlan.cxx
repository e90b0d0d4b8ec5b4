// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "stream/Plan.hxx"
#include "http/Range.hxx"
#include "http/HeaderList.hxx"

#include <gtest/gtest.h>

static StreamPlan
MakePlan(uint64_t size, const char *header)
{
	HttpRangeRequest range(size);
	if (header != nullptr)
		range.ParseRangeHeader(header);
	return MakeStreamPlan(range);
}

static std::string
GetHeader(const HttpHeaderList &headers, std::string_view name)
{
	const auto *value = headers.Find(name);
	return value != nullptr ? *value : std::string{};
}

TEST(StreamPlan, FullFile)
{
	const auto plan = MakePlan(10000, nullptr);
	EXPECT_EQ(plan.status, HttpStatus::OK);
	EXPECT_FALSE(plan.is_partial);
	EXPECT_EQ(plan.start, 0u);
	EXPECT_EQ(plan.end, 9999u);
	EXPECT_EQ(plan.chunk_size, 10000u);
	EXPECT_EQ(plan.total_size, 10000u);

	const auto headers = MakeStreamHeaders(plan);
	EXPECT_FALSE(headers.Contains("content-range"));
	EXPECT_EQ(GetHeader(headers, "accept-ranges"), "bytes");
	EXPECT_EQ(GetHeader(headers, "content-length"), "10000");
	EXPECT_EQ(GetHeader(headers, "content-type"), "video/mp4");
	EXPECT_EQ(GetHeader(headers, "cache-control"), "no-cache");
}

TEST(StreamPlan, Range)
{
	const auto plan = MakePlan(10000, "bytes=0-999");
	EXPECT_EQ(plan.status, HttpStatus::PARTIAL_CONTENT);
	EXPECT_TRUE(plan.is_partial);
	EXPECT_EQ(plan.start, 0u);
	EXPECT_EQ(plan.end, 999u);
	EXPECT_EQ(plan.chunk_size, 1000u);

	const auto headers = MakeStreamHeaders(plan);
	EXPECT_EQ(GetHeader(headers, "content-range"), "bytes 0-999/10000");
	EXPECT_EQ(GetHeader(headers, "content-length"), "1000");
}

TEST(StreamPlan, OpenEnded)
{
	const auto plan = MakePlan(10000, "bytes=9000-");
	EXPECT_TRUE(plan.is_partial);
	EXPECT_EQ(plan.start, 9000u);
	EXPECT_EQ(plan.end, 9999u);
	EXPECT_EQ(plan.chunk_size, 1000u);

	EXPECT_EQ(GetHeader(MakeStreamHeaders(plan), "content-range"),
		  "bytes 9000-9999/10000");
}

TEST(StreamPlan, LastByte)
{
	const auto plan = MakePlan(10000, "bytes=9999-9999");
	EXPECT_EQ(plan.chunk_size, 1u);
	EXPECT_EQ(GetHeader(MakeStreamHeaders(plan), "content-range"),
		  "bytes 9999-9999/10000");
}

TEST(StreamPlan, EmptyFile)
{
	const auto plan = MakePlan(0, nullptr);
	EXPECT_EQ(plan.status, HttpStatus::OK);
	EXPECT_FALSE(plan.is_partial);
	EXPECT_EQ(plan.chunk_size, 0u);
	EXPECT_EQ(plan.total_size, 0u);
	EXPECT_EQ(GetHeader(MakeStreamHeaders(plan), "content-length"), "0");
}

TEST(StreamPlan, Unsatisfiable)
{
	try {
		MakePlan(10000, "bytes=20000-");
		FAIL();
	} catch (const HttpRangeError &e) {
		EXPECT_TRUE(e.IsUnsatisfiable());
		EXPECT_EQ(e.GetSize(), 10000u);
	}

	/* every range on an empty file is unsatisfiable */
	try {
		MakePlan(0, "bytes=0-0");
		FAIL();
	} catch (const HttpRangeError &e) {
		EXPECT_TRUE(e.IsUnsatisfiable());
		EXPECT_EQ(e.GetSize(), 0u);
	}
}

TEST(StreamPlan, Malformed)
{
	try {
		MakePlan(10000, "bytes=abc");
		FAIL();
	} catch (const HttpRangeError &e) {
		EXPECT_FALSE(e.IsUnsatisfiable());
		EXPECT_EQ(e.GetType(), HttpRangeRequest::Type::MALFORMED);
	}
}
