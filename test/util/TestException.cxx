// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "util/Exception.hxx"

#include <gtest/gtest.h>

#include <system_error>

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
			throw std::system_error(std::make_error_code(std::errc::no_such_file_or_directory),
						"Failed to open \"x\"");
		} catch (...) {
			std::throw_with_nested(std::runtime_error("Error in line 3 of \"a.conf\""));
		}
	} catch (const std::runtime_error &e) {
		const auto msg = GetFullMessage(e);
		EXPECT_EQ(msg.find("Error in line 3 of \"a.conf\"; Failed to open \"x\""), 0u);
		EXPECT_NE(GetFullMessage(e, "?", ": ").find("a.conf\": Failed"),
			  std::string::npos);
	}
}

TEST(ExceptionTest, NotDerivedFromStdException)
{
	EXPECT_EQ(GetFullMessage(std::make_exception_ptr(42)), "Unknown exception");
}
