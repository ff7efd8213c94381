// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "io/BufferedOutputStream.hxx"
#include "io/StringOutputStream.hxx"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

using std::string_view_literals::operator""sv;

TEST(BufferedOutputStream, Buffering)
{
	StringOutputStream sos;
	BufferedOutputStream bos{sos, 8};

	bos.Write("abc"sv);
	bos.Write("def"sv);
	EXPECT_EQ(sos.GetValue(), "");

	/* doesn't fit: the buffer is flushed first */
	bos.Write("ghi"sv);
	EXPECT_EQ(sos.GetValue(), "abcdef");

	bos.Flush();
	EXPECT_EQ(sos.GetValue(), "abcdefghi");

	/* flushing an empty buffer is a no-op */
	bos.Flush();
	EXPECT_EQ(sos.GetValue(), "abcdefghi");
}

TEST(BufferedOutputStream, Large)
{
	StringOutputStream sos;
	BufferedOutputStream bos{sos, 8};

	bos.Write("ab"sv);

	const std::string large(100, 'x');
	bos.Write(large);
	EXPECT_EQ(sos.GetValue(), "ab" + large);

	bos.Write("c"sv);
	bos.Flush();
	EXPECT_EQ(sos.GetValue(), "ab" + large + "c");
}

TEST(BufferedOutputStream, Error)
{
	class FailingOutputStream final : public OutputStream {
	public:
		void Write(std::span<const std::byte>) override {
			throw std::runtime_error("Write failed");
		}
	};

	FailingOutputStream fos;
	BufferedOutputStream bos{fos, 8};

	bos.Write("abc"sv);
	EXPECT_THROW(bos.Flush(), std::runtime_error);
}
