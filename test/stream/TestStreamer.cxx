// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "../co/RunTask.hxx"
#include "../io/TempDirectory.hxx"
#include "stream/Streamer.hxx"
#include "stream/Sink.hxx"
#include "http/Range.hxx"
#include "http/HeaderList.hxx"
#include "http/RequestContext.hxx"
#include "event/Loop.hxx"
#include "net/SocketProtocolError.hxx"

#include <gtest/gtest.h>

#include <fmt/format.h>

#include <cstdint>

namespace {

/**
 * A #StreamSink which collects everything in memory.
 */
class StringSink final : public StreamSink {
public:
	HttpStatus status = HttpStatus::UNDEFINED;
	HttpHeaderList headers;
	std::string body;

	unsigned n_heads = 0, n_bodies = 0;

	/**
	 * Simulate a client disconnect as soon as this many body
	 * bytes have been received.
	 */
	std::size_t disconnect_after = SIZE_MAX;

	bool aborted = false;

	Co::Task<void> SendHead(HttpStatus _status,
				const HttpHeaderList &_headers) override {
		++n_heads;
		status = _status;
		headers = _headers;
		co_return;
	}

	Co::Task<void> SendBody(std::span<const std::byte> src) override {
		if (body.size() >= disconnect_after)
			throw SocketClosedPrematurelyError{};

		++n_bodies;
		body.append(ToStringView(src));
		co_return;
	}

	void Abort() noexcept override {
		aborted = true;
	}
};

struct Context {
	EventLoop event_loop;
	const RequestContext ctx{LLogger{"test"}, "stream"};
};

static StreamPlan
MakePlan(uint64_t size, const char *range_header)
{
	HttpRangeRequest range(size);
	if (range_header != nullptr)
		range.ParseRangeHeader(range_header);
	return MakeStreamPlan(range);
}

} // anonymous namespace

TEST(MediaStreamer, FullFile)
{
	Context c;
	const auto data = MakeTestData(10000);

	StringSink sink;
	MediaStreamer streamer(c.ctx, MakeTempFile(data),
			       MakePlan(data.size(), nullptr), 4096);
	RunTask(c.event_loop, streamer.Run(sink));

	EXPECT_EQ(streamer.GetState(), MediaStreamer::State::COMPLETED);
	EXPECT_EQ(streamer.GetBytesSent(), data.size());
	EXPECT_FALSE(streamer.IsClientDisconnected());

	EXPECT_EQ(sink.n_heads, 1u);
	EXPECT_EQ(sink.n_bodies, 3u);
	EXPECT_EQ(sink.status, HttpStatus::OK);
	EXPECT_EQ(sink.body, data);
	EXPECT_FALSE(sink.aborted);
}

TEST(MediaStreamer, Range)
{
	Context c;
	const auto data = MakeTestData(10000);

	StringSink sink;
	MediaStreamer streamer(c.ctx, MakeTempFile(data),
			       MakePlan(data.size(), "bytes=1000-2999"), 512);
	RunTask(c.event_loop, streamer.Run(sink));

	EXPECT_EQ(streamer.GetState(), MediaStreamer::State::COMPLETED);
	EXPECT_EQ(sink.status, HttpStatus::PARTIAL_CONTENT);
	EXPECT_EQ(sink.body, data.substr(1000, 2000));

	const auto *content_range = sink.headers.Find("content-range");
	ASSERT_NE(content_range, nullptr);
	EXPECT_EQ(*content_range, "bytes 1000-2999/10000");
}

/**
 * Consecutive range requests must reproduce the whole file.
 */
TEST(MediaStreamer, Tiling)
{
	Context c;
	const auto data = MakeTestData(5000, 7);
	constexpr std::size_t step = 777;

	std::string result;
	for (std::size_t offset = 0; offset < data.size(); offset += step) {
		const std::size_t end = std::min(offset + step, data.size()) - 1;
		const auto header = fmt::format("bytes={}-{}", offset, end);

		StringSink sink;
		MediaStreamer streamer(c.ctx, MakeTempFile(data),
				       MakePlan(data.size(), header.c_str()),
				       256);
		RunTask(c.event_loop, streamer.Run(sink));

		ASSERT_EQ(streamer.GetState(), MediaStreamer::State::COMPLETED);
		ASSERT_EQ(sink.body.size(), end - offset + 1);
		result += sink.body;
	}

	EXPECT_EQ(result, data);
}

TEST(MediaStreamer, HeadOnly)
{
	Context c;
	const auto data = MakeTestData(3000);

	StringSink sink;
	MediaStreamer streamer(c.ctx, MakeTempFile(data),
			       MakePlan(data.size(), nullptr), 1024);
	RunTask(c.event_loop, streamer.Run(sink, false));

	EXPECT_EQ(streamer.GetState(), MediaStreamer::State::COMPLETED);
	EXPECT_EQ(sink.n_heads, 1u);
	EXPECT_EQ(sink.n_bodies, 0u);
	EXPECT_TRUE(sink.body.empty());

	const auto *content_length = sink.headers.Find("content-length");
	ASSERT_NE(content_length, nullptr);
	EXPECT_EQ(*content_length, "3000");
}

TEST(MediaStreamer, EmptyFile)
{
	Context c;

	StringSink sink;
	MediaStreamer streamer(c.ctx, MakeTempFile({}),
			       MakePlan(0, nullptr), 1024);
	RunTask(c.event_loop, streamer.Run(sink));

	EXPECT_EQ(streamer.GetState(), MediaStreamer::State::COMPLETED);
	EXPECT_EQ(sink.n_heads, 1u);
	EXPECT_EQ(sink.status, HttpStatus::OK);
	EXPECT_TRUE(sink.body.empty());
}

/**
 * The file is shorter than the plan says; the first read fails, so
 * nothing must be sent.
 */
TEST(MediaStreamer, ReadErrorBeforeHead)
{
	Context c;
	const auto data = MakeTestData(500);

	StringSink sink;
	MediaStreamer streamer(c.ctx, MakeTempFile(data),
			       MakePlan(1000, "bytes=600-"), 256);
	EXPECT_THROW(RunTask(c.event_loop, streamer.Run(sink)), StreamError);

	EXPECT_EQ(streamer.GetState(), MediaStreamer::State::FAILED);
	EXPECT_EQ(sink.n_heads, 0u);
	EXPECT_FALSE(sink.aborted);
}

/**
 * The file is truncated while streaming; the transfer must be
 * aborted.
 */
TEST(MediaStreamer, ReadErrorAfterHead)
{
	Context c;
	const auto data = MakeTestData(500);

	StringSink sink;
	MediaStreamer streamer(c.ctx, MakeTempFile(data),
			       MakePlan(1000, nullptr), 256);
	RunTask(c.event_loop, streamer.Run(sink));

	EXPECT_EQ(streamer.GetState(), MediaStreamer::State::ABORTED);
	EXPECT_FALSE(streamer.IsClientDisconnected());
	EXPECT_EQ(sink.n_heads, 1u);
	EXPECT_EQ(sink.body, data);
	EXPECT_TRUE(sink.aborted);
}

TEST(MediaStreamer, ClientDisconnect)
{
	Context c;
	const auto data = MakeTestData(4096);

	StringSink sink;
	sink.disconnect_after = 1024;

	MediaStreamer streamer(c.ctx, MakeTempFile(data),
			       MakePlan(data.size(), nullptr), 512);
	RunTask(c.event_loop, streamer.Run(sink));

	EXPECT_EQ(streamer.GetState(), MediaStreamer::State::ABORTED);
	EXPECT_TRUE(streamer.IsClientDisconnected());
	EXPECT_EQ(streamer.GetBytesSent(), 1024u);
	EXPECT_EQ(sink.body, data.substr(0, 1024));
	EXPECT_FALSE(sink.aborted);
}
