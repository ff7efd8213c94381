// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "util/StringSearch.hxx"

#include <gtest/gtest.h>

#include <string>

using std::string_view_literals::operator""sv;

/**
 * A naive implementation to compare with.
 */
static std::vector<std::size_t>
NaiveFindAll(std::string_view haystack, std::string_view pattern)
{
	std::vector<std::size_t> result;
	if (pattern.empty())
		return result;

	for (std::size_t pos = haystack.find(pattern); pos != haystack.npos;
	     pos = haystack.find(pattern, pos + pattern.size()))
		result.push_back(pos);

	return result;
}

TEST(HorspoolSearcher, ShiftTable)
{
	const HorspoolSearcher s{"abcab"sv};

	/* the last pattern byte is not in the table */
	EXPECT_EQ(s.GetShift('a'), 1u);
	EXPECT_EQ(s.GetShift('b'), 3u);
	EXPECT_EQ(s.GetShift('c'), 2u);
	EXPECT_EQ(s.GetShift('x'), 5u);
	EXPECT_EQ(s.GetShift('\xff'), 5u);
}

TEST(HorspoolSearcher, Find)
{
	const HorspoolSearcher s{"8.8.8.8"sv};

	EXPECT_EQ(s.Find("8.8.8.8"sv), 0u);
	EXPECT_EQ(s.Find("x 8.8.8.8 y"sv), 2u);
	EXPECT_EQ(s.Find("8.8.8.9"sv), std::string_view::npos);
	EXPECT_EQ(s.Find("8.8.8"sv), std::string_view::npos);
	EXPECT_EQ(s.Find(""sv), std::string_view::npos);
	EXPECT_EQ(s.Find("8.8.8.8"sv, 1), std::string_view::npos);
	EXPECT_EQ(s.Find("8.8.8.8"sv, 100), std::string_view::npos);
}

TEST(HorspoolSearcher, EmptyPattern)
{
	const HorspoolSearcher s{""sv};

	EXPECT_EQ(s.Find("foo"sv), std::string_view::npos);
	EXPECT_TRUE(s.FindAll("foo"sv).empty());
}

TEST(HorspoolSearcher, FindAll)
{
	const HorspoolSearcher s{"8.8.8.8"sv};

	EXPECT_EQ(s.FindAll("8.8.8.8 - frank proxy 8.8.8.8 direct 8.8.8.8"sv),
		  (std::vector<std::size_t>{0, 22, 37}));
}

TEST(HorspoolSearcher, NonOverlapping)
{
	EXPECT_EQ(HorspoolSearcher{"8.8.8.8"sv}.FindAll("8.8.8.8.8.8"sv),
		  (std::vector<std::size_t>{0}));
	EXPECT_EQ(HorspoolSearcher{"aa"sv}.FindAll("aaaaa"sv),
		  (std::vector<std::size_t>{0, 2}));
}

TEST(HorspoolSearcher, CompareNaive)
{
	static constexpr std::string_view patterns[] = {
		"a"sv, "ab"sv, "aba"sv, "abab"sv, "baab"sv, "aaaa"sv,
		"::1"sv, "1.2"sv,
	};

	static constexpr std::string_view haystacks[] = {
		""sv,
		"a"sv,
		"abababababa"sv,
		"baabaabaabbaab"sv,
		"aaaaaaaaa"sv,
		"::1 ::1::1 1.2.1.2 1.21.2"sv,
		"xyz"sv,
	};

	for (const auto pattern : patterns) {
		const HorspoolSearcher s{pattern};
		for (const auto haystack : haystacks)
			EXPECT_EQ(s.FindAll(haystack),
				  NaiveFindAll(haystack, pattern))
				<< "pattern=" << pattern
				<< " haystack=" << haystack;
	}
}

TEST(ReplaceAll, Basic)
{
	EXPECT_EQ(ReplaceAll(" - frank proxy 8.8.8.8 direct 8.8.8.8"sv,
			     "8.8.8.8"sv, "127.0.0.1"sv),
		  " - frank proxy 127.0.0.1 direct 127.0.0.1");
	EXPECT_EQ(ReplaceAll("8.8.8.8.8.8"sv, "8.8.8.8"sv, "127.0.0.1"sv),
		  "127.0.0.1.8.8");
}

TEST(ReplaceAll, NoOp)
{
	EXPECT_EQ(ReplaceAll("foo"sv, ""sv, "x"sv), "foo");
	EXPECT_EQ(ReplaceAll("foo"sv, "foobar"sv, "x"sv), "foo");
	EXPECT_EQ(ReplaceAll("foo"sv, "bar"sv, "x"sv), "foo");
	EXPECT_EQ(ReplaceAll(""sv, "bar"sv, "x"sv), "");
}

TEST(ReplaceAll, Lengths)
{
	/* empty, shorter and longer replacements */
	EXPECT_EQ(ReplaceAll("a-b-c"sv, "-"sv, ""sv), "abc");
	EXPECT_EQ(ReplaceAll("a--b--c"sv, "--"sv, "+"sv), "a+b+c");
	EXPECT_EQ(ReplaceAll("a-b"sv, "-"sv, "<...>"sv), "a<...>b");
	EXPECT_EQ(ReplaceAll("--"sv, "-"sv, "xyz"sv), "xyzxyz");
}

TEST(ReplaceAll, Binary)
{
	const std::string haystack{"\x00\xff\x00\xff\x00"sv};
	EXPECT_EQ(ReplaceAll(haystack, "\xff\x00"sv, "!"sv),
		  "\x00!!"sv);
}

TEST(ReplaceAll, Append)
{
	const HorspoolSearcher s{"b"sv};

	std::string dest = "prefix:";
	EXPECT_EQ(s.ReplaceAll(dest, "abcb"sv, "B"sv), 2u);
	EXPECT_EQ(dest, "prefix:aBcB");
}
