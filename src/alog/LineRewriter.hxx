// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "Stats.hxx"

#include <string>
#include <string_view>

class BufferedOutputStream;
class BufferedReader;

namespace Alog {

struct Config;

/**
 * Replaces the first word of log lines (usually "$remote_addr") with
 * the configured replacement string.  Each line is processed
 * independently; the only state kept between lines is a scratch
 * buffer and the statistics.
 */
class LineRewriter {
	const Config &config;

	/**
	 * Scratch buffer for "thorough" mode, reused for each line.
	 */
	std::string buffer;

	Stats stats;

public:
	explicit LineRewriter(const Config &_config) noexcept
		:config(_config) {}

	LineRewriter(const LineRewriter &) = delete;
	LineRewriter &operator=(const LineRewriter &) = delete;

	const Stats &GetStats() const noexcept {
		return stats;
	}

	/**
	 * Rewrite one line (including its terminator) and write the
	 * result to the given stream.  Lines without a first word are
	 * copied or omitted (depending on Config::skip).  This does
	 * not flush.
	 *
	 * Throws on output error.
	 *
	 * @return true if something was written
	 */
	bool RewriteLine(std::string_view line, BufferedOutputStream &os);

	/**
	 * Rewrite all lines from the given reader until it ends.
	 * With Config::flush, the stream is flushed after each line
	 * which was written; otherwise it is not flushed at all.
	 *
	 * Throws on input or output error.
	 */
	void RewriteAll(BufferedReader &reader, BufferedOutputStream &os);

private:
	/**
	 * Write #tail (the remainder of the line after the first
	 * word), replacing all further occurrences of #token in
	 * "thorough" mode.
	 */
	void WriteTail(std::string_view token, std::string_view tail,
		       std::string_view replacement,
		       BufferedOutputStream &os);
};

} // namespace Alog
