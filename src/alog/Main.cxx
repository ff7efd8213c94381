// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "CommandLine.hxx"
#include "Run.hxx"
#include "io/Logger.hxx"

#include <exception>

#include <stdlib.h>

static const LLogger logger{"alog"};

int
main(int argc, char **argv) noexcept
try {
	const auto cmdline = Alog::ParseCommandLine(argc, argv);
	if (cmdline.help || cmdline.version)
		return EXIT_SUCCESS;

	SetLogLevel(cmdline.verbose);

	Alog::Run(cmdline.config, cmdline.io);
	return EXIT_SUCCESS;
} catch (...) {
	/* level 0 is shown even with --quiet */
	logger.Write(0, std::current_exception());
	return EXIT_FAILURE;
}
