// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "UTF8.hxx"

static constexpr bool
IsContinuation(unsigned char ch) noexcept
{
	return (ch & 0xc0) == 0x80;
}

/**
 * The lower bound of the second byte after the given lead byte.
 * This rejects overlong encodings and code points above U+10FFFF.
 */
static constexpr unsigned char
SecondByteMin(unsigned char lead) noexcept
{
	switch (lead) {
	case 0xe0:
		return 0xa0;

	case 0xf0:
		return 0x90;

	default:
		return 0x80;
	}
}

/**
 * The upper bound of the second byte after the given lead byte.
 * This rejects UTF-16 surrogates and code points above U+10FFFF.
 */
static constexpr unsigned char
SecondByteMax(unsigned char lead) noexcept
{
	switch (lead) {
	case 0xed:
		return 0x9f;

	case 0xf4:
		return 0x8f;

	default:
		return 0xbf;
	}
}

/**
 * @return the total length of a sequence starting with this lead
 * byte, or 0 if this is not a valid lead byte
 */
static constexpr std::size_t
LeadLength(unsigned char lead) noexcept
{
	if (lead < 0x80)
		return 1;
	else if (lead < 0xc2)
		/* continuation byte or overlong 2-byte lead */
		return 0;
	else if (lead < 0xe0)
		return 2;
	else if (lead < 0xf0)
		return 3;
	else if (lead < 0xf5)
		return 4;
	else
		return 0;
}

/**
 * Count how many bytes at the beginning of the string form a valid
 * (possibly incomplete) prefix of a sequence.
 *
 * @param[out] expected the length of the complete sequence (0 if
 * the lead byte is invalid)
 */
static std::size_t
ValidPrefixLength(std::string_view s, std::size_t &expected) noexcept
{
	const unsigned char lead = s.front();
	expected = LeadLength(lead);
	if (expected <= 1)
		return expected;

	std::size_t n = 1;
	if (n >= s.size())
		return n;

	const unsigned char second = s[n];
	if (second < SecondByteMin(lead) || second > SecondByteMax(lead))
		return n;

	++n;

	while (n < expected && n < s.size() &&
	       IsContinuation(s[n]))
		++n;

	return n;
}

std::size_t
SequenceLengthUTF8(std::string_view s) noexcept
{
	if (s.empty())
		return 0;

	std::size_t expected;
	const std::size_t n = ValidPrefixLength(s, expected);
	return n == expected ? n : 0;
}

std::size_t
InvalidSequenceLengthUTF8(std::string_view s) noexcept
{
	if (s.empty())
		return 0;

	std::size_t expected;
	const std::size_t n = ValidPrefixLength(s, expected);
	return n > 0 ? n : 1;
}

std::string
ToLossyUTF8(std::string_view s)
{
	std::string result;
	result.reserve(s.size());

	while (!s.empty()) {
		std::size_t n = SequenceLengthUTF8(s);
		if (n > 0) {
			result.append(s.substr(0, n));
		} else {
			n = InvalidSequenceLengthUTF8(s);
			result.append(UTF8_REPLACEMENT_CHARACTER);
		}

		s.remove_prefix(n);
	}

	return result;
}
