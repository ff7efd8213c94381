// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Token.hxx"

#include <algorithm>
#include <iterator>

namespace Alog {

std::string_view
StripLeadingWhitespace(std::string_view line) noexcept
{
	const auto i = std::find_if_not(line.begin(), line.end(),
					IsWhitespaceASCII);
	if (i == line.end())
		return line;

	line.remove_prefix(std::distance(line.begin(), i));
	return line;
}

std::size_t
FindTokenEnd(std::string_view line) noexcept
{
	const auto i = std::find_if(line.begin(), line.end(),
				    IsTokenDelimiter);
	if (i == line.end())
		return line.npos;

	return std::distance(line.begin(), i);
}

} // namespace Alog
