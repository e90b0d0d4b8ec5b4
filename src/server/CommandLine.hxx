// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <filesystem>

struct CommandLine {
	/**
	 * The configuration file; empty if none was specified.
	 */
	std::filesystem::path config_path;

	bool verbose = false;
};

/**
 * Throws on error.
 */
CommandLine
ParseCommandLine(int argc, char **argv);
