// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "co/Task.hxx"
#include "io/FileDescriptor.hxx"

#include <cstdint>
#include <string>
#include <string_view>

struct RequestContext;
class EventLoop;
class UploadSessionRegistry;

struct FinalizeRequest {
	/**
	 * The filename declared by the client (not yet sanitized).
	 */
	std::string_view filename;

	unsigned total_chunks;

	uint64_t file_size;
};

struct FinalizeResult {
	/**
	 * The name of the new file in the video directory.
	 */
	std::string filename;

	uint64_t size;
};

/**
 * Concatenates the chunks of a complete upload session into a new
 * file in the video directory.
 */
class UploadFinalizer {
	EventLoop &event_loop;

	UploadSessionRegistry &registry;

	const FileDescriptor chunk_directory, video_directory;

public:
	UploadFinalizer(EventLoop &_event_loop,
			UploadSessionRegistry &_registry,
			FileDescriptor _chunk_directory,
			FileDescriptor _video_directory) noexcept
		:event_loop(_event_loop), registry(_registry),
		 chunk_directory(_chunk_directory),
		 video_directory(_video_directory) {}

	/**
	 * Verify that all chunks are present, concatenate them and
	 * publish the result in the video directory.  On success,
	 * the session and its chunks are deleted; on failure, nothing
	 * is published and the chunks are kept.
	 *
	 * Throws #UploadError on error.
	 */
	Co::Task<FinalizeResult> Finalize(const RequestContext &ctx,
					  FinalizeRequest request);
};
