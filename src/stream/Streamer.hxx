// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Plan.hxx"
#include "co/Task.hxx"
#include "io/UniqueFileDescriptor.hxx"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <stdexcept>

struct RequestContext;
class StreamSink;

/**
 * Reading the file failed before anything was sent to the peer.  The
 * nested exception describes the cause.
 */
class StreamError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

/**
 * Transmits the window described by a #StreamPlan from a file to a
 * #StreamSink.
 */
class MediaStreamer {
public:
	enum class State : uint_least8_t {
		IDLE,

		/**
		 * The response head has been sent; no body data yet.
		 */
		HEADERS_SENT,

		STREAMING,

		COMPLETED,

		/**
		 * Reading failed after the response head had been
		 * sent, or the peer has disconnected.
		 */
		ABORTED,

		/**
		 * Reading failed before the response head was sent.
		 */
		FAILED,
	};

private:
	const RequestContext &ctx;

	UniqueFileDescriptor fd;

	const StreamPlan plan;

	const std::size_t block_size;

	const std::unique_ptr<std::byte[]> buffer;

	uint64_t position, remaining;

	uint64_t bytes_sent = 0;

	State state = State::IDLE;

	bool client_disconnected = false;

public:
	MediaStreamer(const RequestContext &_ctx, UniqueFileDescriptor &&_fd,
		      const StreamPlan &_plan, std::size_t _block_size);

	MediaStreamer(const MediaStreamer &) = delete;
	MediaStreamer &operator=(const MediaStreamer &) = delete;

	State GetState() const noexcept {
		return state;
	}

	uint64_t GetBytesSent() const noexcept {
		return bytes_sent;
	}

	bool IsClientDisconnected() const noexcept {
		return client_disconnected;
	}

	/**
	 * Send the response to the sink.  Must be called only once.
	 *
	 * Throws #StreamError if reading failed before anything was
	 * sent; the caller should then generate an error response.
	 * Other errors after the head was sent are handled
	 * internally by aborting the sink.
	 *
	 * @param send_body false to send only the response head
	 * (i.e. for a "HEAD" request)
	 */
	Co::Task<void> Run(StreamSink &sink, bool send_body=true);

private:
	/**
	 * Read the next block into #buffer.
	 *
	 * Throws on error.
	 *
	 * @return the number of bytes read (never zero)
	 */
	std::size_t ReadBlock();

	void OnClientDisconnected() noexcept;
	void OnCompleted(std::chrono::steady_clock::duration duration) noexcept;
};
