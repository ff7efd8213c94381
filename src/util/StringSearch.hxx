// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

/**
 * Search for a fixed pattern using the Boyer-Moore-Horspool
 * algorithm.  The constructor builds a "bad character" table in
 * O(m + 256); Find() runs in O(n/m) in the average case and O(n*m)
 * in the worst case.
 *
 * The pattern is not copied; it must remain valid for the lifetime
 * of this object.
 */
class HorspoolSearcher {
	std::string_view pattern;

	/**
	 * For each byte value: how far the window may be moved if the
	 * last byte of the window is this value.  That is the distance
	 * of its last occurrence in the pattern (excluding the last
	 * pattern byte) to the end of the pattern, or the pattern
	 * length if it does not occur.
	 */
	std::array<std::size_t, 256> shift;

public:
	explicit HorspoolSearcher(std::string_view _pattern) noexcept;

	HorspoolSearcher(const HorspoolSearcher &) = delete;
	HorspoolSearcher &operator=(const HorspoolSearcher &) = delete;

	std::size_t GetShift(char ch) const noexcept {
		return shift[static_cast<unsigned char>(ch)];
	}

	/**
	 * Find the first occurrence of the pattern at or after the
	 * given position.
	 *
	 * @return the position or std::string_view::npos if there is
	 * none (or if the pattern is empty)
	 */
	[[gnu::pure]]
	std::size_t Find(std::string_view haystack,
			 std::size_t start=0) const noexcept;

	/**
	 * Find all non-overlapping occurrences, from left to right.
	 * After a match, the search continues after the end of the
	 * match.
	 */
	std::vector<std::size_t> FindAll(std::string_view haystack) const;

	/**
	 * Append a copy of #haystack to #dest, with every
	 * non-overlapping occurrence of the pattern substituted by
	 * #replacement.
	 *
	 * @return the number of substitutions
	 */
	std::size_t ReplaceAll(std::string &dest, std::string_view haystack,
			       std::string_view replacement) const;
};

/**
 * Return a copy of #haystack with all non-overlapping occurrences of
 * #pattern substituted by #replacement.  An empty pattern or one
 * that is longer than the haystack leaves it unchanged.
 */
std::string
ReplaceAll(std::string_view haystack, std::string_view pattern,
	   std::string_view replacement);
