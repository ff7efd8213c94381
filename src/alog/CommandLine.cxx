// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "CommandLine.hxx"
#include "lib/fmt/RuntimeError.hxx"

#include <fmt/core.h>

#include <getopt.h>

#ifndef ALOG_VERSION
#error ALOG_VERSION is not defined
#endif

namespace Alog {

enum Option : int {
	OPTION_NO_OPTIMIZE = 0x100,
};

static constexpr struct option long_options[] = {
	{"help", no_argument, nullptr, 'h'},
	{"version", no_argument, nullptr, 'V'},
	{"verbose", no_argument, nullptr, 'v'},
	{"quiet", no_argument, nullptr, 'q'},
	{"ipv4-replacement", required_argument, nullptr, '4'},
	{"ipv6-replacement", required_argument, nullptr, '6'},
	{"host-replacement", required_argument, nullptr, 'H'},
	{"skip-invalid", no_argument, nullptr, 's'},
	{"authuser", no_argument, nullptr, 'a'},
	{"notrim", no_argument, nullptr, 'n'},
	{"no-optimize", no_argument, nullptr, OPTION_NO_OPTIMIZE},
	{"thorough", no_argument, nullptr, 't'},
	{"flush-line", no_argument, nullptr, 'f'},
	{"output", required_argument, nullptr, 'o'},
	{nullptr, 0, nullptr, 0},
};

/* the leading colon makes getopt_long() return ':' for a missing
   argument */
static constexpr char short_options[] = ":hVvq4:6:H:sanfto:";

static void
PrintUsage(const char *argv0) noexcept
{
	const ReplacementConfig defaults;

	fmt::print("Usage: {} [OPTIONS] [INPUT...]\n"
		   "\n"
		   "Replace the first word of each line (e.g. \"$remote_addr\" in\n"
		   "common/combined access logs) with a replacement string.\n"
		   "Reads standard input if no INPUT (or \"-\") is given.\n"
		   "\n"
		   "Options:\n"
		   "  -4, --ipv4-replacement STR  Sets IPv4 replacement string [{}]\n"
		   "  -6, --ipv6-replacement STR  Sets IPv6 replacement string [{}]\n"
		   "  -H, --host-replacement STR  Sets host replacement string [{}]\n"
		   "  -s, --skip-invalid          Skip lines without a first word\n"
		   "  -a, --authuser              Clear the \"$remote_user\" field\n"
		   "  -n, --notrim                Don't remove whitespace from the start of every line\n"
		   "      --no-optimize           Don't skip \"$remote_user\" fields which look cleared\n"
		   "  -t, --thorough              Replace every occurrence of the first word\n"
		   "  -f, --flush-line            Flush output on every line\n"
		   "  -o, --output FILE           Append output to FILE\n"
		   "  -v, --verbose               Log more messages to stderr\n"
		   "  -q, --quiet                 Log only fatal errors\n"
		   "  -V, --version               Print the version and exit\n"
		   "  -h, --help                  Print this help and exit\n",
		   argv0, defaults.ipv4, defaults.ipv6, defaults.host);
}

CommandLine
ParseCommandLine(int argc, char **argv)
{
	CommandLine cmdline;

	/* reinitialize getopt (allows parsing more than once) */
	optind = 0;
	opterr = 0;

	int o;
	while ((o = getopt_long(argc, argv, short_options,
				long_options, nullptr)) != -1) {
		switch (o) {
		case 'h':
			PrintUsage(argv[0]);
			cmdline.help = true;
			return cmdline;

		case 'V':
			fmt::print("alog " ALOG_VERSION "\n");
			cmdline.version = true;
			return cmdline;

		case 'v':
			++cmdline.verbose;
			break;

		case 'q':
			cmdline.verbose = 0;
			break;

		case '4':
			cmdline.config.replacements.ipv4 = optarg;
			break;

		case '6':
			cmdline.config.replacements.ipv6 = optarg;
			break;

		case 'H':
			cmdline.config.replacements.host = optarg;
			break;

		case 's':
			cmdline.config.skip = true;
			break;

		case 'a':
			cmdline.config.authuser = true;
			break;

		case 'n':
			cmdline.config.trim = false;
			break;

		case OPTION_NO_OPTIMIZE:
			cmdline.config.optimize = false;
			break;

		case 't':
			cmdline.config.thorough = true;
			break;

		case 'f':
			cmdline.config.flush = true;
			break;

		case 'o':
			if (*optarg == 0)
				throw std::runtime_error("Empty output file name");

			cmdline.io.output = optarg;
			break;

		case ':':
			throw FmtRuntimeError("Option '{}' requires an argument",
					      argv[optind - 1]);

		case '?':
			if (optopt > 0 && optopt < 0x100)
				throw FmtRuntimeError("Unknown option '-{}'; try '--help'",
						      static_cast<char>(optopt));

			throw FmtRuntimeError("Unknown option '{}'; try '--help'",
					      argv[optind - 1]);

		default:
			throw std::runtime_error("Failed to parse the command line");
		}
	}

	for (int i = optind; i < argc; ++i)
		cmdline.io.inputs.emplace_back(argv[i]);

	return cmdline;
}

} // namespace Alog
