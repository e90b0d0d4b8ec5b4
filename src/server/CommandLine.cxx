// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "CommandLine.hxx"
#include "lib/fmt/RuntimeError.hxx"

#include <string_view>

CommandLine
ParseCommandLine(int argc, char **argv)
{
	CommandLine cmdline;

	for (int i = 1; i < argc; ++i) {
		const std::string_view arg = argv[i];

		if (arg == "--config" || arg == "-c") {
			if (++i >= argc)
				throw FmtRuntimeError("Option '{}' requires a value", arg);

			cmdline.config_path = argv[i];
		} else if (arg.starts_with("--config=")) {
			cmdline.config_path = arg.substr(9);
		} else if (arg == "--verbose" || arg == "-v") {
			cmdline.verbose = true;
		} else
			throw FmtRuntimeError("Unrecognized argument: '{}'", arg);
	}

	return cmdline;
}
