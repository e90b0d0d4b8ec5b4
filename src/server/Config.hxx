// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "upload/Config.hxx"

#include <cstddef>
#include <filesystem>
#include <string>

struct Config {
	unsigned listen_port = 5001;

	/**
	 * Where the videos are stored and served from.
	 */
	std::filesystem::path video_directory = "videos";

	/**
	 * Where chunks of unfinished uploads are stored.
	 */
	std::filesystem::path chunk_directory = "chunks";

	UploadConfig upload;

	/**
	 * The size of each read() while streaming a video.
	 */
	std::size_t stream_block_size = 64 * 1024;

	/**
	 * If not empty, then CORS headers allowing this origin are
	 * added to each response.
	 */
	std::string cors_origin;

	unsigned verbose = 2;

	/**
	 * Throws on error.
	 */
	void Check() const;
};

/**
 * Load the specified configuration file into the #Config object.
 *
 * Throws on error.
 */
void
LoadConfigFile(Config &config, const std::filesystem::path &path);
