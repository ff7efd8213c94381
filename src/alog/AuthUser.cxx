// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "AuthUser.hxx"
#include "util/CharUtil.hxx"

using std::string_view_literals::operator""sv;

namespace Alog {

/**
 * Does the string begin with one or two digits and a slash?
 */
static constexpr bool
IsDayPrefix(std::string_view s) noexcept
{
	if (s.size() < 2 || !IsDigitASCII(s[0]))
		return false;

	if (s[1] == '/')
		return true;

	return s.size() >= 3 && IsDigitASCII(s[1]) && s[2] == '/';
}

std::size_t
FindTimeLocal(std::string_view line, std::size_t start) noexcept
{
	static constexpr auto anchor = " ["sv;

	while (true) {
		const auto i = line.find(anchor, start);
		if (i == line.npos)
			return i;

		if (IsDayPrefix(line.substr(i + anchor.size())))
			return i;

		start = i + 1;
	}
}

bool
IsAuthUserCleared(std::string_view line, std::size_t token_end) noexcept
{
	static constexpr auto cleared = "- ["sv;
	static constexpr std::size_t offset = 3;

	return line.size() >= token_end + offset + cleared.size() &&
		line.substr(token_end + offset, cleared.size()) == cleared;
}

} // namespace Alog
