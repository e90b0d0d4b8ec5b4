// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

enum class UploadErrorCode : uint_least8_t {
	/**
	 * The client filename is empty.
	 */
	INVALID_FILENAME,

	/**
	 * The filename does not have one of the accepted video
	 * extensions.
	 */
	INVALID_FILE_TYPE,

	/**
	 * A numeric field is missing or not a valid number.
	 */
	INVALID_FIELD,

	/**
	 * The chunk number is not within 1..totalChunks.
	 */
	INVALID_CHUNK_ORDINAL,

	CHUNK_TOO_LARGE,

	/**
	 * The declared file size exceeds the configured limit.
	 */
	UPLOAD_TOO_LARGE,

	/**
	 * The request disagrees with the session about the number of
	 * chunks or the file size.
	 */
	SESSION_MISMATCH,

	/**
	 * There is no session for this filename (never started,
	 * already finalized or expired).
	 */
	UNKNOWN_SESSION,

	/**
	 * Finalizing is not possible because some chunks are
	 * missing; see UploadError::GetMissing().
	 */
	INCOMPLETE_UPLOAD,

	/**
	 * The concatenated chunks do not have the declared size; see
	 * UploadError::GetExpected() and UploadError::GetActual().
	 */
	SIZE_MISMATCH,

	/**
	 * A file with the final name exists already.
	 */
	ARTIFACT_EXISTS,

	/**
	 * An I/O error has occurred; the nested exception describes
	 * it.
	 */
	IO_FAILURE,
};

[[gnu::const]]
const char *
ToString(UploadErrorCode code) noexcept;

/**
 * An upload request was rejected or has failed.
 */
class UploadError : public std::runtime_error {
	UploadErrorCode code;

	std::vector<unsigned> missing;

	uint64_t expected = 0, actual = 0;

public:
	UploadError(UploadErrorCode _code, const char *_msg)
		:std::runtime_error(_msg), code(_code) {}

	UploadError(UploadErrorCode _code, const std::string &_msg)
		:std::runtime_error(_msg), code(_code) {}

	static UploadError Incomplete(std::vector<unsigned> &&_missing);

	static UploadError SizeMismatch(uint64_t _expected, uint64_t _actual);

	UploadErrorCode GetCode() const noexcept {
		return code;
	}

	/**
	 * The ordinals of the missing chunks
	 * (#UploadErrorCode::INCOMPLETE_UPLOAD).
	 */
	const auto &GetMissing() const noexcept {
		return missing;
	}

	uint64_t GetExpected() const noexcept {
		return expected;
	}

	uint64_t GetActual() const noexcept {
		return actual;
	}
};
