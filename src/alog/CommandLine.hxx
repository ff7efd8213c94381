// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "Config.hxx"

namespace Alog {

struct CommandLine {
	Config config;
	IOConfig io;

	/**
	 * The log level (see io/Logger.hxx).
	 */
	unsigned verbose = 1;

	/**
	 * Was "--help" given?  Usage was printed.
	 */
	bool help = false;

	/**
	 * Was "--version" given?  The version was printed.
	 */
	bool version = false;
};

/**
 * Parse the command line.  "--help" and "--version" print to stdout
 * and set the according flag; the caller is expected to exit then.
 *
 * Throws std::runtime_error on error.
 */
CommandLine
ParseCommandLine(int argc, char **argv);

} // namespace Alog
