// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "CommandLine.hxx"
#include "Config.hxx"
#include "Instance.hxx"
#include "io/Logger.hxx"
#include "util/PrintException.hxx"

#include <stdlib.h>

int
main(int argc, char **argv) noexcept
try {
	const auto cmdline = ParseCommandLine(argc, argv);

	Config config;
	if (!cmdline.config_path.empty())
		LoadConfigFile(config, cmdline.config_path);

	if (cmdline.verbose)
		config.verbose = 3;

	config.Check();

	SetLogLevel(config.verbose);

	Instance instance(config);
	instance.Run();

	LogConcat(2, "vidstream", "exiting");
	return EXIT_SUCCESS;
} catch (...) {
	PrintException(std::current_exception());
	return EXIT_FAILURE;
}
