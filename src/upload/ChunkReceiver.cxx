// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "ChunkReceiver.hxx"
#include "Config.hxx"
#include "Error.hxx"
#include "Name.hxx"
#include "Registry.hxx"
#include "event/Loop.hxx"
#include "http/RequestContext.hxx"
#include "io/FileAt.hxx"
#include "io/FileWriter.hxx"
#include "io/MakeDirectory.hxx"
#include "io/RecursiveDelete.hxx"
#include "io/UniqueFileDescriptor.hxx"

#include <fmt/format.h>

#include <algorithm>
#include <chrono>
#include <exception>

static void
CheckChunk(const UploadChunk &chunk, const UploadConfig &config)
{
	if (chunk.total_chunks < 1)
		throw UploadError(UploadErrorCode::INVALID_FIELD,
				  "totalChunks must be at least 1");

	if (chunk.chunk_number < 1 || chunk.chunk_number > chunk.total_chunks)
		throw UploadError(UploadErrorCode::INVALID_CHUNK_ORDINAL,
				  fmt::format("Chunk number {} is out of range 1..{}",
					      chunk.chunk_number,
					      chunk.total_chunks));

	if (chunk.data.size() > config.max_chunk_size)
		throw UploadError(UploadErrorCode::CHUNK_TOO_LARGE,
				  fmt::format("Chunk size {} exceeds the limit of {} bytes",
					      chunk.data.size(),
					      config.max_chunk_size));

	if (chunk.file_size > config.max_upload_size)
		throw UploadError(UploadErrorCode::UPLOAD_TOO_LARGE,
				  fmt::format("File size {} exceeds the limit of {} bytes",
					      chunk.file_size,
					      config.max_upload_size));

	/* every chunk but an empty single one carries at least one
	   byte, and none carries more than max_chunk_size */
	if (chunk.total_chunks > std::max<uint64_t>(chunk.file_size, 1))
		throw UploadError(UploadErrorCode::INVALID_FIELD,
				  fmt::format("totalChunks {} exceeds the file size {}",
					      chunk.total_chunks,
					      chunk.file_size));

	if (chunk.file_size > uint64_t{chunk.total_chunks} * config.max_chunk_size)
		throw UploadError(UploadErrorCode::INVALID_FIELD,
				  fmt::format("File size {} does not fit in {} chunks",
					      chunk.file_size,
					      chunk.total_chunks));
}

static void
WriteChunk(FileDescriptor chunk_directory, const std::string &storage_name,
	   unsigned chunk_number, std::span<const std::byte> data)
{
	const auto session_directory =
		MakeDirectory(chunk_directory, storage_name.c_str());

	FileWriter writer(session_directory,
			  fmt::format_int{chunk_number}.c_str(), 0600);
	writer.Write(data);
	writer.Commit(FileWriter::CommitMode::REPLACE);
}

Co::Task<UploadChunkResult>
ChunkReceiver::Receive(const RequestContext &ctx, UploadChunk chunk)
{
	const auto key = SanitizeFilename(chunk.filename);
	if (key.empty())
		throw UploadError(UploadErrorCode::INVALID_FILENAME,
				  "No filename");

	CheckChunk(chunk, config);

	auto session = registry.Find(key);
	if (session && !session->Matches(chunk.total_chunks, chunk.file_size)) {
		if (chunk.chunk_number != 1 || session->IsBusy())
			throw UploadError(UploadErrorCode::SESSION_MISMATCH,
					  fmt::format("Upload '{}' was started with {} chunks and {} bytes",
						      key, session->total_chunks,
						      session->declared_size));

		/* the client starts over with different parameters;
		   discard the old session */
		ctx.logger.Fmt(2, "discarding upload session '{}' ({} of {} chunks)",
			       session->storage_name,
			       session->GetReceivedCount(),
			       session->total_chunks);

		registry.Remove(*session);

		try {
			RecursiveDelete({chunk_directory, session->storage_name.c_str()});
		} catch (...) {
			ctx.logger(1, "failed to delete chunks: ",
				   std::current_exception());
		}

		session.reset();
	}

	if (!session) {
		session = registry.Create(key, chunk.total_chunks,
					  chunk.file_size,
					  event_loop.SteadyNow(),
					  std::chrono::system_clock::now());
		ctx.logger.Fmt(2, "new upload session '{}' ({} chunks, {} bytes)",
			       session->storage_name, chunk.total_chunks,
			       chunk.file_size);
	}

	const auto lock = co_await session->mutex;

	if (!registry.IsCurrent(*session))
		/* finalized or expired while we were waiting */
		throw UploadError(UploadErrorCode::UNKNOWN_SESSION,
				  fmt::format("Upload '{}' is no longer active",
					      key));

	try {
		WriteChunk(chunk_directory, session->storage_name,
			   chunk.chunk_number, chunk.data);
	} catch (...) {
		std::throw_with_nested(UploadError(UploadErrorCode::IO_FAILURE,
						   fmt::format("Failed to store chunk {}",
							       chunk.chunk_number)));
	}

	session->MarkReceived(chunk.chunk_number);
	session->Touch(event_loop.SteadyNow());

	ctx.logger.Fmt(3, "stored chunk {}/{} of '{}' ({} bytes)",
		       chunk.chunk_number, chunk.total_chunks,
		       session->storage_name, chunk.data.size());

	co_return UploadChunkResult{
		chunk.chunk_number,
		session->GetReceivedCount(),
		session->total_chunks,
		session->storage_name,
	};
}
