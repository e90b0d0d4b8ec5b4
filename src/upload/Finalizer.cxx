// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Finalizer.hxx"
#include "Error.hxx"
#include "Name.hxx"
#include "Registry.hxx"
#include "event/co/Yield.hxx"
#include "http/RequestContext.hxx"
#include "io/CopyRegularFile.hxx"
#include "io/FileAt.hxx"
#include "io/FileWriter.hxx"
#include "io/Open.hxx"
#include "io/RecursiveDelete.hxx"
#include "io/UniqueFileDescriptor.hxx"
#include "util/FormatBytes.hxx"

#include <fmt/format.h>

#include <cerrno>
#include <exception>
#include <system_error>
#include <vector>

#include <fcntl.h> // for AT_SYMLINK_NOFOLLOW
#include <sys/stat.h>
#include <unistd.h> // for faccessat()

/**
 * Determine the sizes of all chunk files.
 *
 * Throws #UploadError if chunks are missing.
 */
static std::vector<off_t>
StatChunks(FileDescriptor directory, unsigned total_chunks)
{
	std::vector<off_t> sizes;
	sizes.reserve(total_chunks);

	std::vector<unsigned> missing;

	for (unsigned i = 1; i <= total_chunks; ++i) {
		struct stat st;
		if (fstatat(directory.Get(), fmt::format_int{i}.c_str(),
			    &st, AT_SYMLINK_NOFOLLOW) < 0 ||
		    !S_ISREG(st.st_mode)) {
			missing.push_back(i);
			continue;
		}

		sizes.push_back(st.st_size);
	}

	if (!missing.empty())
		throw UploadError::Incomplete(std::move(missing));

	return sizes;
}

static bool
Exists(FileDescriptor directory, const char *name) noexcept
{
	return faccessat(directory.Get(), name, F_OK, AT_SYMLINK_NOFOLLOW) == 0;
}

Co::Task<FinalizeResult>
UploadFinalizer::Finalize(const RequestContext &ctx, FinalizeRequest request)
{
	const auto key = SanitizeFilename(request.filename);
	if (key.empty())
		throw UploadError(UploadErrorCode::INVALID_FILENAME,
				  "No filename");

	const auto session = registry.Find(key);
	if (!session)
		throw UploadError(UploadErrorCode::UNKNOWN_SESSION,
				  fmt::format("No upload session for '{}'", key));

	if (!session->Matches(request.total_chunks, request.file_size))
		throw UploadError(UploadErrorCode::SESSION_MISMATCH,
				  fmt::format("Upload '{}' was started with {} chunks and {} bytes",
					      key, session->total_chunks,
					      session->declared_size));

	const auto lock = co_await session->mutex;

	if (!registry.IsCurrent(*session))
		/* another finalize has completed while we were
		   waiting */
		throw UploadError(UploadErrorCode::UNKNOWN_SESSION,
				  fmt::format("No upload session for '{}'", key));

	const auto &storage_name = session->storage_name;

	if (auto missing = session->GetMissing(); !missing.empty())
		throw UploadError::Incomplete(std::move(missing));

	if (Exists(video_directory, storage_name.c_str()))
		throw UploadError(UploadErrorCode::ARTIFACT_EXISTS,
				  fmt::format("File '{}' exists already",
					      storage_name));

	UniqueFileDescriptor session_directory;

	try {
		session_directory = OpenDirectory({chunk_directory, storage_name.c_str()});
	} catch (const std::system_error &e) {
		if (e.code() == std::errc::no_such_file_or_directory) {
			/* the chunk directory has vanished */
			std::vector<unsigned> missing;
			for (unsigned i = 1; i <= session->total_chunks; ++i)
				missing.push_back(i);
			throw UploadError::Incomplete(std::move(missing));
		}

		std::throw_with_nested(UploadError(UploadErrorCode::IO_FAILURE,
						   "Failed to open the chunk directory"));
	}

	const auto sizes = StatChunks(session_directory, session->total_chunks);

	uint64_t total_size = 0;
	for (const auto size : sizes)
		total_size += size;

	if (total_size != session->declared_size)
		throw UploadError::SizeMismatch(session->declared_size,
						total_size);

	ctx.logger.Fmt(2, "assembling {} chunks of '{}' ({})",
		       session->total_chunks, storage_name,
		       FormatBytes(total_size));

	FileWriter writer;

	try {
		writer = FileWriter(video_directory, storage_name.c_str(), 0644);
		writer.Allocate(total_size);
	} catch (...) {
		std::throw_with_nested(UploadError(UploadErrorCode::IO_FAILURE,
						   "Failed to create the output file"));
	}

	for (unsigned i = 1; i <= session->total_chunks; ++i) {
		try {
			const auto chunk_fd =
				OpenReadOnly(session_directory,
					     fmt::format_int{i}.c_str());
			CopyRegularFile(chunk_fd, writer.GetFileDescriptor(),
					sizes[i - 1]);
		} catch (...) {
			std::throw_with_nested(UploadError(UploadErrorCode::IO_FAILURE,
							   fmt::format("Failed to copy chunk {}", i)));
		}

		/* let other connections run between two chunks */
		co_await Co::Yield{event_loop};
	}

	const off_t actual_size = writer.GetFileDescriptor().GetSize();
	if (actual_size < 0 || uint64_t(actual_size) != session->declared_size)
		throw UploadError::SizeMismatch(session->declared_size,
						actual_size < 0 ? 0 : actual_size);

	try {
		writer.Commit(FileWriter::CommitMode::NO_REPLACE);
	} catch (const std::system_error &e) {
		if (e.code() == std::errc::file_exists)
			throw UploadError(UploadErrorCode::ARTIFACT_EXISTS,
					  fmt::format("File '{}' exists already",
						      storage_name));

		std::throw_with_nested(UploadError(UploadErrorCode::IO_FAILURE,
						   "Failed to publish the output file"));
	}

	FinalizeResult result{storage_name, session->declared_size};

	registry.Remove(*session);

	try {
		RecursiveDelete({chunk_directory, result.filename.c_str()});
	} catch (...) {
		ctx.logger(1, "failed to delete chunks: ",
			   std::current_exception());
	}

	ctx.logger.Fmt(2, "upload '{}' completed ({})",
		       result.filename, FormatBytes(result.size));

	co_return result;
}
