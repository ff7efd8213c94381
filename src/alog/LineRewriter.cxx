// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "LineRewriter.hxx"
#include "AuthUser.hxx"
#include "Config.hxx"
#include "Token.hxx"
#include "net/AddressKind.hxx"
#include "io/BufferedOutputStream.hxx"
#include "io/BufferedReader.hxx"
#include "util/SpanCast.hxx"
#include "util/StringSearch.hxx"

using std::string_view_literals::operator""sv;

namespace Alog {

inline void
LineRewriter::WriteTail(std::string_view token, std::string_view tail,
			std::string_view replacement,
			BufferedOutputStream &os)
{
	if (!config.thorough || token.empty()) {
		os.Write(tail);
		return;
	}

	buffer.clear();

	const HorspoolSearcher searcher{token};
	stats.thorough_replaced += searcher.ReplaceAll(buffer, tail,
						       replacement);
	os.Write(buffer);
}

bool
LineRewriter::RewriteLine(std::string_view line, BufferedOutputStream &os)
{
	++stats.lines;

	if (config.trim)
		line = StripLeadingWhitespace(line);

	const std::size_t token_end = FindTokenEnd(line);
	if (token_end == line.npos) {
		/* no first word */
		if (config.skip) {
			++stats.skipped;
			return false;
		}

		++stats.passed;
		os.Write(line);
		return true;
	}

	const std::string_view token = line.substr(0, token_end);
	const std::string_view replacement =
		config.replacements.Get(ClassifyAddress(token));

	++stats.rewritten;
	os.Write(replacement);

	std::string_view tail = line.substr(token_end);

	if (config.authuser &&
	    !(config.optimize && IsAuthUserCleared(line, token_end))) {
		if (const std::size_t time_local = FindTimeLocal(line, token_end);
		    time_local != line.npos) {
			os.Write(" - -"sv);
			tail = line.substr(time_local);
			++stats.authuser_cleared;
		}
	}

	WriteTail(token, tail, replacement, os);
	return true;
}

void
LineRewriter::RewriteAll(BufferedReader &reader, BufferedOutputStream &os)
{
	while (true) {
		const auto line = reader.ReadLine();
		if (line.empty())
			break;

		if (RewriteLine(ToStringView(line), os) && config.flush)
			os.Flush();
	}
}

} // namespace Alog
