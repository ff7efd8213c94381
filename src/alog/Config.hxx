// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "net/AddressKind.hxx"

#include <string>
#include <string_view>
#include <vector>

namespace Alog {

/**
 * The strings which replace the first word of each line.  The
 * defaults are equivalents of "localhost".
 */
struct ReplacementConfig {
	/**
	 * Replaces any IPv4-parseable first word.
	 */
	std::string ipv4 = "127.0.0.1";

	/**
	 * Replaces any IPv6-parseable first word.
	 */
	std::string ipv6 = "::1";

	/**
	 * Replaces any other first word (e.g. a host name).
	 */
	std::string host = "localhost";

	[[gnu::pure]]
	std::string_view Get(AddressKind kind) const noexcept {
		switch (kind) {
		case AddressKind::IPV4:
			return ipv4;

		case AddressKind::IPV6:
			return ipv6;

		case AddressKind::NONE:
			break;
		}

		return host;
	}
};

struct Config {
	ReplacementConfig replacements;

	/**
	 * Omit lines without a first word instead of copying them
	 * unchanged.
	 */
	bool skip = false;

	/**
	 * Replace the "$remote_user" field with "-".
	 */
	bool authuser = false;

	/**
	 * Remove ASCII whitespace from the beginning of each line
	 * before looking for the first word.
	 */
	bool trim = true;

	/**
	 * With #authuser: assume that a "$remote_user" field which is
	 * followed by "- [" has already been cleared, and skip the
	 * (expensive) search for the "$time_local" field.
	 *
	 * This is a heuristic; it misfires on an unredacted line
	 * whose "$remote_user" field happens to begin with "- [".
	 */
	bool optimize = true;

	/**
	 * Replace every occurrence of the first word in the rest of
	 * the line, not only the first one.
	 */
	bool thorough = false;

	/**
	 * Flush the output after each line.
	 */
	bool flush = false;
};

/**
 * Where to read from and write to.
 */
struct IOConfig {
	/**
	 * The input files, in the order they shall be processed.  An
	 * empty list means standard input; the special name "-" does
	 * as well.
	 */
	std::vector<std::string> inputs;

	/**
	 * The output file; data gets appended to it, and it is
	 * created if it does not exist.  An empty string means
	 * standard output.
	 */
	std::string output;
};

} // namespace Alog
