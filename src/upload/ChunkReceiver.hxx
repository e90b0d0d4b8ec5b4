// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "co/Task.hxx"
#include "io/FileDescriptor.hxx"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

struct RequestContext;
struct UploadConfig;
class EventLoop;
class UploadSessionRegistry;

struct UploadChunk {
	/**
	 * The filename declared by the client (not yet sanitized).
	 */
	std::string_view filename;

	/**
	 * The 1-based number of this chunk.
	 */
	unsigned chunk_number;

	unsigned total_chunks;

	/**
	 * The size of the whole file declared by the client.
	 */
	uint64_t file_size;

	std::span<const std::byte> data;
};

struct UploadChunkResult {
	unsigned chunk_number;

	/**
	 * The number of distinct chunks received so far.
	 */
	unsigned received;

	unsigned total_chunks;

	std::string storage_name;
};

/**
 * Accepts chunks of uploads and stores them in the chunk directory,
 * one subdirectory per session.
 */
class ChunkReceiver {
	EventLoop &event_loop;

	UploadSessionRegistry &registry;

	const UploadConfig &config;

	const FileDescriptor chunk_directory;

public:
	ChunkReceiver(EventLoop &_event_loop,
		      UploadSessionRegistry &_registry,
		      const UploadConfig &_config,
		      FileDescriptor _chunk_directory) noexcept
		:event_loop(_event_loop), registry(_registry),
		 config(_config),
		 chunk_directory(_chunk_directory) {}

	/**
	 * Validate and store one chunk.  Storing a chunk number again
	 * replaces the previous one.  Chunk 1 with a different chunk
	 * count or file size discards an idle session and starts a
	 * new one.
	 *
	 * Throws #UploadError on error.
	 */
	Co::Task<UploadChunkResult> Receive(const RequestContext &ctx,
					    UploadChunk chunk);
};
