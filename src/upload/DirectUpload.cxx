// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "DirectUpload.hxx"
#include "Config.hxx"
#include "Error.hxx"
#include "Name.hxx"
#include "event/Loop.hxx"
#include "event/co/Yield.hxx"
#include "http/RequestContext.hxx"
#include "io/FileWriter.hxx"
#include "util/FormatBytes.hxx"

#include <fmt/format.h>

#include <algorithm>
#include <chrono>
#include <exception>
#include <system_error>

/**
 * The amount of data written before yielding to the event loop.
 */
static constexpr std::size_t WRITE_SLICE = 1024 * 1024;

Co::Task<FinalizeResult>
DirectUploader::Store(const RequestContext &ctx, std::string_view filename,
		      std::span<const std::byte> data)
{
	const auto sanitized = SanitizeFilename(filename);
	if (sanitized.empty())
		throw UploadError(UploadErrorCode::INVALID_FILENAME,
				  "No filename");

	if (data.size() > config.max_upload_size)
		throw UploadError(UploadErrorCode::UPLOAD_TOO_LARGE,
				  fmt::format("File size exceeds maximum limit of {}",
					      FormatBytes(config.max_upload_size)));

	if (!HasVideoExtension(sanitized))
		throw UploadError(UploadErrorCode::INVALID_FILE_TYPE,
				  "Invalid file type. Allowed types: .mp4, .avi, .mov, .mkv, .webm");

	const uint64_t size = data.size();

	const auto storage_name =
		MakeStorageName(sanitized, std::chrono::system_clock::now());

	ctx.logger.Fmt(2, "storing upload '{}' ({})",
		       storage_name, FormatBytes(size));

	FileWriter writer;

	try {
		writer = FileWriter(video_directory, storage_name.c_str(), 0644);
		writer.Allocate(size);
	} catch (...) {
		std::throw_with_nested(UploadError(UploadErrorCode::IO_FAILURE,
						   "Failed to create the output file"));
	}

	while (!data.empty()) {
		const auto slice = data.first(std::min(data.size(), WRITE_SLICE));

		try {
			writer.Write(slice);
		} catch (...) {
			std::throw_with_nested(UploadError(UploadErrorCode::IO_FAILURE,
							   "Failed to write the output file"));
		}

		data = data.subspan(slice.size());

		if (!data.empty())
			co_await Co::Yield{event_loop};
	}

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

	ctx.logger.Fmt(2, "upload '{}' completed ({})",
		       storage_name, FormatBytes(size));

	co_return FinalizeResult{storage_name, size};
}
