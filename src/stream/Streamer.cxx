// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Streamer.hxx"
#include "Sink.hxx"
#include "http/HeaderList.hxx"
#include "http/RequestContext.hxx"
#include "net/SocketProtocolError.hxx"
#include "system/Error.hxx"
#include "util/Exception.hxx"
#include "util/FormatBytes.hxx"

#include <algorithm>
#include <cassert>
#include <exception>

MediaStreamer::MediaStreamer(const RequestContext &_ctx,
			     UniqueFileDescriptor &&_fd,
			     const StreamPlan &_plan,
			     std::size_t _block_size)
	:ctx(_ctx), fd(std::move(_fd)), plan(_plan),
	 block_size(_block_size),
	 buffer(new std::byte[_block_size]),
	 position(_plan.start), remaining(_plan.chunk_size)
{
}

std::size_t
MediaStreamer::ReadBlock()
{
	const std::size_t max_size = std::min<uint64_t>(block_size, remaining);
	const auto nbytes = fd.ReadAt(position, {buffer.get(), max_size});
	if (nbytes < 0)
		throw MakeErrno("Failed to read from video file");

	if (nbytes == 0)
		throw std::runtime_error("Premature end of video file");

	ctx.logger.Fmt(3, "read {} bytes at offset {}", nbytes, position);
	return static_cast<std::size_t>(nbytes);
}

inline void
MediaStreamer::OnClientDisconnected() noexcept
{
	fd.Close();
	state = State::ABORTED;
	client_disconnected = true;

	ctx.logger.Fmt(2, "client disconnected after {}",
		       FormatBytes(bytes_sent));
}

inline void
MediaStreamer::OnCompleted(std::chrono::steady_clock::duration duration) noexcept
{
	fd.Close();
	state = State::COMPLETED;

	if (!CheckLogLevel(2))
		return;

	const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
	const uint64_t throughput = ms > 0
		? bytes_sent * 1000 / static_cast<uint64_t>(ms)
		: bytes_sent;

	ctx.logger.Fmt(2, "{} streaming completed: {} in {}ms ({}/s)",
		       plan.is_partial ? "range" : "full file",
		       FormatBytes(bytes_sent), ms,
		       FormatBytes(throughput));
}

Co::Task<void>
MediaStreamer::Run(StreamSink &sink, bool send_body)
{
	assert(state == State::IDLE);

	const auto start_time = std::chrono::steady_clock::now();

	if (!send_body)
		remaining = 0;

	/* read the first block before sending the head, so a read
	   error can still be reported with a proper status */
	std::size_t length = 0;
	if (remaining > 0) {
		try {
			length = ReadBlock();
		} catch (...) {
			fd.Close();
			state = State::FAILED;
			std::throw_with_nested(StreamError("Failed to read video file"));
		}
	}

	if (plan.is_partial)
		ctx.logger.Fmt(2, "streaming range {}-{}/{} ({})",
			       plan.start, plan.end, plan.total_size,
			       FormatBytes(plan.chunk_size));
	else
		ctx.logger.Fmt(2, "streaming full file ({})",
			       FormatBytes(plan.total_size));

	const auto headers = MakeStreamHeaders(plan);

	try {
		co_await sink.SendHead(plan.status, headers);
	} catch (const SocketClosedPrematurelyError &) {
		OnClientDisconnected();
		co_return;
	} catch (...) {
		fd.Close();
		state = State::FAILED;
		throw;
	}

	state = State::HEADERS_SENT;

	while (remaining > 0) {
		state = State::STREAMING;

		try {
			co_await sink.SendBody({buffer.get(), length});
		} catch (const SocketClosedPrematurelyError &) {
			OnClientDisconnected();
			co_return;
		} catch (...) {
			ctx.logger(1, "failed to send video: ",
				   std::current_exception());
			fd.Close();
			state = State::ABORTED;
			sink.Abort();
			co_return;
		}

		bytes_sent += length;
		position += length;
		remaining -= length;

		if (remaining == 0)
			break;

		try {
			length = ReadBlock();
		} catch (...) {
			ctx.logger(1, "failed to read video file: ",
				   std::current_exception());
			fd.Close();
			state = State::ABORTED;
			sink.Abort();
			co_return;
		}
	}

	OnCompleted(std::chrono::steady_clock::now() - start_time);
}
