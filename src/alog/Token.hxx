// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "util/CharUtil.hxx"

#include <cstddef>
#include <string_view>

namespace Alog {

/**
 * Is this a character which terminates the first word?  Line
 * terminators are not, because a line without a blank has no first
 * word.
 */
constexpr bool
IsTokenDelimiter(char ch) noexcept
{
	return IsBlankASCII(ch);
}

/**
 * Remove all ASCII whitespace from the beginning of the line.  A
 * line which consists only of whitespace is returned unmodified.
 */
[[gnu::pure]]
std::string_view
StripLeadingWhitespace(std::string_view line) noexcept;

/**
 * Find the end of the first word, i.e. the position of the first
 * delimiter (see IsTokenDelimiter()).  The first word is the range
 * [0, result), which may be empty if the line begins with a
 * delimiter.
 *
 * @return the position of the delimiter or std::string_view::npos if
 * the line has no first word
 */
[[gnu::pure]]
std::size_t
FindTokenEnd(std::string_view line) noexcept;

} // namespace Alog
