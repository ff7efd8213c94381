// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "io/BufferedReader.hxx"
#include "io/MemoryReader.hxx"
#include "util/SpanCast.hxx"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

using std::string_view_literals::operator""sv;

static std::vector<std::string>
ReadAllLines(std::string_view input, std::size_t max_read,
	     std::size_t buffer_size)
{
	MemoryReader reader{AsBytes(input), max_read};
	BufferedReader buffered{reader, buffer_size};

	std::vector<std::string> result;
	while (true) {
		const auto line = buffered.ReadLine();
		if (line.empty())
			break;

		result.emplace_back(ToStringView(line));
	}

	EXPECT_EQ(buffered.GetLineNumber(), result.size());

	/* end-of-stream is sticky */
	EXPECT_TRUE(buffered.ReadLine().empty());

	return result;
}

TEST(BufferedReader, Empty)
{
	EXPECT_TRUE(ReadAllLines(""sv, SIZE_MAX, 16).empty());
}

TEST(BufferedReader, Lines)
{
	const std::vector<std::string> expected{"a\n", "bc\n", "\n", "def\n"};
	EXPECT_EQ(ReadAllLines("a\nbc\n\ndef\n"sv, SIZE_MAX, 1024), expected);
}

TEST(BufferedReader, Unterminated)
{
	const std::vector<std::string> expected{"a\n", "bc"};
	EXPECT_EQ(ReadAllLines("a\nbc"sv, SIZE_MAX, 1024), expected);
}

TEST(BufferedReader, CarriageReturn)
{
	const std::vector<std::string> expected{"a\r\n", "b\r"};
	EXPECT_EQ(ReadAllLines("a\r\nb\r"sv, SIZE_MAX, 1024), expected);
}

TEST(BufferedReader, ShortReads)
{
	const std::vector<std::string> expected{"hello\n", "world\n", "!"};

	for (std::size_t max_read = 1; max_read < 8; ++max_read)
		EXPECT_EQ(ReadAllLines("hello\nworld\n!"sv, max_read, 4),
			  expected);
}

TEST(BufferedReader, LongLine)
{
	/* much longer than the initial buffer */
	const std::string long_line = std::string(10000, 'x') + "\n";
	const std::string input = long_line + "y\n" + long_line;

	const std::vector<std::string> expected{long_line, "y\n", long_line};
	EXPECT_EQ(ReadAllLines(input, 100, 16), expected);
}

TEST(BufferedReader, Error)
{
	class FailingReader final : public Reader {
	public:
		std::size_t Read(std::span<std::byte>) override {
			throw std::runtime_error("Read failed");
		}
	};

	FailingReader reader;
	BufferedReader buffered{reader};
	EXPECT_THROW(buffered.ReadLine(), std::runtime_error);
}
