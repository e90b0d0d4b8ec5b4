// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "event/Chrono.hxx"

#include <chrono>
#include <cstddef>
#include <cstdint>

/**
 * Limits for chunked uploads.
 */
struct UploadConfig {
	/**
	 * The maximum size of one chunk.
	 */
	std::size_t max_chunk_size = 2 * 1024 * 1024;

	/**
	 * The maximum declared size of a whole upload.
	 */
	uint64_t max_upload_size = UINT64_C(500) * 1024 * 1024;

	/**
	 * Sessions which are idle for this duration are discarded.
	 */
	Event::Duration session_timeout = std::chrono::hours{24};
};
