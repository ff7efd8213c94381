// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include <cstddef>
#include <string>
#include <string_view>

/**
 * The UTF-8 encoding of U+FFFD REPLACEMENT CHARACTER.
 */
inline constexpr std::string_view UTF8_REPLACEMENT_CHARACTER = "\xef\xbf\xbd";

/**
 * Determine the length of the well-formed UTF-8 sequence at the
 * beginning of the given string.
 *
 * @return the length of the sequence in bytes, or 0 if the string
 * does not begin with a well-formed sequence (this includes a
 * truncated sequence at the end of the string)
 */
[[gnu::pure]]
std::size_t
SequenceLengthUTF8(std::string_view s) noexcept;

/**
 * Determine the length of the "maximal subpart" of an ill-formed
 * sequence at the beginning of the given string, i.e. the number of
 * bytes to be substituted by one replacement character (Unicode
 * 15.0, section 3.9, U+FFFD substitution of maximal subparts).
 * Always returns at least 1 for a non-empty string.
 */
[[gnu::pure]]
std::size_t
InvalidSequenceLengthUTF8(std::string_view s) noexcept;

/**
 * Decode the given bytes as UTF-8, substituting each ill-formed
 * subsequence with U+FFFD.  This never fails.
 */
std::string
ToLossyUTF8(std::string_view s);
