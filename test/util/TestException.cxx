// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "util/Exception.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "lib/fmt/SystemError.hxx"

#include <gtest/gtest.h>

TEST(ExceptionTest, RuntimeError)
{
	ASSERT_EQ(GetFullMessage(std::make_exception_ptr(std::runtime_error("Foo"))), "Foo");
}

TEST(ExceptionTest, DerivedError)
{
	class DerivedError : public std::runtime_error {
	public:
		explicit DerivedError(const char *_msg)
			:std::runtime_error(_msg) {}
	};

	ASSERT_EQ(GetFullMessage(std::make_exception_ptr(DerivedError("Foo"))), "Foo");
}

TEST(ExceptionTest, Nested)
{
	try {
		try {
			throw std::runtime_error("Inner");
		} catch (...) {
			std::throw_with_nested(std::runtime_error("Outer"));
		}
	} catch (...) {
		EXPECT_EQ(GetFullMessage(std::current_exception()),
			  "Outer; Inner");
		EXPECT_EQ(GetFullMessage(std::current_exception(),
					 "fallback", ": "),
			  "Outer: Inner");
	}
}

TEST(ExceptionTest, FmtRuntimeError)
{
	const auto e = FmtRuntimeError("Failed to open '{}'", "foo.log");
	EXPECT_STREQ(e.what(), "Failed to open 'foo.log'");
}

TEST(ExceptionTest, FmtErrno)
{
	const auto e = FmtErrno(ENOENT, "Failed to open '{}'", "foo.log");
	EXPECT_TRUE(IsFileNotFound(e));
	EXPECT_EQ(std::string_view{e.what()}.substr(0, 24),
		  "Failed to open 'foo.log'");
}
