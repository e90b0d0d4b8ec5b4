// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Finalizer.hxx"
#include "co/Task.hxx"
#include "io/FileDescriptor.hxx"

#include <cstddef>
#include <span>
#include <string_view>

struct RequestContext;
struct UploadConfig;
class EventLoop;

/**
 * Stores a video which was uploaded in one request (not in chunks)
 * in the video directory.
 */
class DirectUploader {
	EventLoop &event_loop;

	const UploadConfig &config;

	const FileDescriptor video_directory;

public:
	DirectUploader(EventLoop &_event_loop, const UploadConfig &_config,
		       FileDescriptor _video_directory) noexcept
		:event_loop(_event_loop), config(_config),
		 video_directory(_video_directory) {}

	/**
	 * Validate the upload and publish it under a new unique name
	 * ("<unix-ms>_<sanitized>").  Nothing is visible under that
	 * name until the whole file has been written.
	 *
	 * Throws #UploadError on error.
	 *
	 * @param filename the filename declared by the client
	 */
	Co::Task<FinalizeResult> Store(const RequestContext &ctx,
				       std::string_view filename,
				       std::span<const std::byte> data);
};
