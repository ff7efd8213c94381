// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

/**
 * Is this a blank character which may appear inside a line, i.e. a
 * space, a tab or a form feed?  Line terminators are not included.
 */
constexpr bool
IsBlankASCII(const char ch) noexcept
{
	return ch == ' ' || ch == '\t' || ch == '\f';
}

/**
 * The ASCII whitespace set: space, tab, line feed, form feed and
 * carriage return.  Vertical tab is not included.
 */
constexpr bool
IsWhitespaceASCII(const char ch) noexcept
{
	return IsBlankASCII(ch) || ch == '\n' || ch == '\r';
}

constexpr bool
IsDigitASCII(char ch) noexcept
{
	return ch >= '0' && ch <= '9';
}
