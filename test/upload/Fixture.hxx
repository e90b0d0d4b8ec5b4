// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "../co/RunTask.hxx"
#include "../io/TempDirectory.hxx"
#include "upload/ChunkReceiver.hxx"
#include "upload/DirectUpload.hxx"
#include "upload/Config.hxx"
#include "upload/Error.hxx"
#include "upload/Finalizer.hxx"
#include "upload/Registry.hxx"
#include "http/RequestContext.hxx"
#include "event/Loop.hxx"
#include "util/SpanCast.hxx"

#include <stdexcept>

/**
 * Run the task and return the #UploadError it throws.
 */
template<typename T>
static UploadError
CatchUploadError(EventLoop &event_loop, Co::Task<T> &&task)
{
	try {
		RunTask(event_loop, std::move(task));
	} catch (const UploadError &e) {
		return e;
	}

	throw std::runtime_error("UploadError expected");
}

struct UploadFixture {
	EventLoop event_loop;

	TempDirectory chunks, videos;

	UploadConfig config;

	UploadSessionRegistry registry;

	ChunkReceiver receiver{
		event_loop, registry, config,
		chunks.GetFileDescriptor(),
	};

	UploadFinalizer finalizer{
		event_loop, registry,
		chunks.GetFileDescriptor(),
		videos.GetFileDescriptor(),
	};

	DirectUploader direct_uploader{
		event_loop, config,
		videos.GetFileDescriptor(),
	};

	const RequestContext ctx{LLogger{"test"}, "upload"};

	Co::Task<UploadChunkResult> Receive(std::string_view filename,
					    unsigned chunk_number,
					    unsigned total_chunks,
					    uint64_t file_size,
					    std::string_view data) {
		return receiver.Receive(ctx, {
				filename,
				chunk_number, total_chunks,
				file_size,
				AsBytes(data),
			});
	}

	UploadChunkResult Send(std::string_view filename,
			       unsigned chunk_number, unsigned total_chunks,
			       uint64_t file_size, std::string_view data) {
		return RunTask(event_loop,
			       Receive(filename, chunk_number, total_chunks,
				       file_size, data));
	}

	UploadErrorCode SendError(std::string_view filename,
				  unsigned chunk_number, unsigned total_chunks,
				  uint64_t file_size, std::string_view data) {
		return CatchUploadError(event_loop,
					Receive(filename, chunk_number,
						total_chunks, file_size,
						data)).GetCode();
	}

	Co::Task<FinalizeResult> Finalize(std::string_view filename,
					  unsigned total_chunks,
					  uint64_t file_size) {
		return finalizer.Finalize(ctx, {filename, total_chunks, file_size});
	}
};
