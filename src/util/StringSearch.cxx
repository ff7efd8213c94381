// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "StringSearch.hxx"

HorspoolSearcher::HorspoolSearcher(std::string_view _pattern) noexcept
	:pattern(_pattern)
{
	const std::size_t m = pattern.size();

	shift.fill(m);

	if (m == 0)
		return;

	for (std::size_t i = 0; i < m - 1; ++i)
		shift[static_cast<unsigned char>(pattern[i])] = m - 1 - i;
}

std::size_t
HorspoolSearcher::Find(std::string_view haystack,
		       std::size_t start) const noexcept
{
	const std::size_t m = pattern.size();
	if (m == 0 || start > haystack.size() ||
	    haystack.size() - start < m)
		return haystack.npos;

	const std::size_t last = haystack.size() - m;

	for (std::size_t pos = start; pos <= last;) {
		/* compare the window right-to-left */
		std::size_t j = m;
		while (haystack[pos + j - 1] == pattern[j - 1])
			if (--j == 0)
				return pos;

		pos += GetShift(haystack[pos + m - 1]);
	}

	return haystack.npos;
}

std::vector<std::size_t>
HorspoolSearcher::FindAll(std::string_view haystack) const
{
	std::vector<std::size_t> result;

	for (std::size_t pos = Find(haystack); pos != haystack.npos;
	     pos = Find(haystack, pos + pattern.size()))
		result.push_back(pos);

	return result;
}

std::size_t
HorspoolSearcher::ReplaceAll(std::string &dest, std::string_view haystack,
			     std::string_view replacement) const
{
	std::size_t n = 0, copied = 0;

	for (std::size_t pos = Find(haystack); pos != haystack.npos;
	     pos = Find(haystack, copied)) {
		dest.append(haystack.substr(copied, pos - copied));
		dest.append(replacement);
		copied = pos + pattern.size();
		++n;
	}

	dest.append(haystack.substr(copied));
	return n;
}

std::string
ReplaceAll(std::string_view haystack, std::string_view pattern,
	   std::string_view replacement)
{
	std::string result;
	result.reserve(haystack.size());

	const HorspoolSearcher searcher{pattern};
	searcher.ReplaceAll(result, haystack, replacement);
	return result;
}
