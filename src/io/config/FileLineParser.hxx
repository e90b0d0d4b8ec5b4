// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "LineParser.hxx"

#include <filesystem>

/**
 * A #LineParser which knows the path of the file being parsed, so
 * relative paths can be resolved against its directory.
 */
class FileLineParser : public LineParser {
	const std::filesystem::path &base_path;

public:
	FileLineParser(const std::filesystem::path &_base_path, char *_p) noexcept
		:LineParser(_p), base_path(_base_path) {}

	/**
	 * Parse a (quoted or unquoted) path.  A relative path is
	 * resolved against the directory of the configuration file.
	 */
	std::filesystem::path ExpectPath();
	std::filesystem::path ExpectPathAndEnd();
};
