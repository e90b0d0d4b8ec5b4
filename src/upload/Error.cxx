// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Error.hxx"

#include <fmt/format.h>

const char *
ToString(UploadErrorCode code) noexcept
{
	switch (code) {
	case UploadErrorCode::INVALID_FILENAME:
		return "InvalidFilename";

	case UploadErrorCode::INVALID_FILE_TYPE:
		return "InvalidFileType";

	case UploadErrorCode::INVALID_FIELD:
		return "InvalidField";

	case UploadErrorCode::INVALID_CHUNK_ORDINAL:
		return "InvalidChunkOrdinal";

	case UploadErrorCode::CHUNK_TOO_LARGE:
		return "ChunkTooLarge";

	case UploadErrorCode::UPLOAD_TOO_LARGE:
		return "UploadTooLarge";

	case UploadErrorCode::SESSION_MISMATCH:
		return "SessionMismatch";

	case UploadErrorCode::UNKNOWN_SESSION:
		return "UnknownSession";

	case UploadErrorCode::INCOMPLETE_UPLOAD:
		return "IncompleteUpload";

	case UploadErrorCode::SIZE_MISMATCH:
		return "SizeMismatch";

	case UploadErrorCode::ARTIFACT_EXISTS:
		return "ArtifactExists";

	case UploadErrorCode::IO_FAILURE:
		return "IoFailure";
	}

	return "Unknown";
}

UploadError
UploadError::Incomplete(std::vector<unsigned> &&_missing)
{
	UploadError e(UploadErrorCode::INCOMPLETE_UPLOAD,
		      fmt::format("Missing {} chunk(s)", _missing.size()));
	e.missing = std::move(_missing);
	return e;
}

UploadError
UploadError::SizeMismatch(uint64_t _expected, uint64_t _actual)
{
	UploadError e(UploadErrorCode::SIZE_MISMATCH,
		      fmt::format("File size mismatch: expected {} bytes, got {}",
				  _expected, _actual));
	e.expected = _expected;
	e.actual = _actual;
	return e;
}
