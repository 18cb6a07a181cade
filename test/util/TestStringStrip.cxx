/*
 * Unit tests for src/util/
 */

#include "util/StringStrip.hxx"

#include <gtest/gtest.h>

#include <string>

using std::string_view_literals::operator""sv;

TEST(StringStrip, StripLeft)
{
	EXPECT_EQ(StripLeft(""sv), ""sv);
	EXPECT_EQ(StripLeft(" \t"sv), ""sv);
	EXPECT_EQ(StripLeft(" a "sv), "a "sv);
	EXPECT_EQ(StripLeft("\0a\0"sv), "a\0"sv);

	EXPECT_STREQ(StripLeft("  play x"), "play x");
	EXPECT_STREQ(StripLeft(""), "");
}

TEST(StringStrip, StripRight)
{
	EXPECT_EQ(StripRight(""sv), ""sv);
	EXPECT_EQ(StripRight(" \t"sv), ""sv);
	EXPECT_EQ(StripRight(" a "sv), " a"sv);

	/* the mutable overload truncates in place */
	std::string s = "/tmp/a song.mp3 \t\r";
	StripRight(s.data());
	EXPECT_STREQ(s.c_str(), "/tmp/a song.mp3");

	s = "   ";
	StripRight(s.data());
	EXPECT_STREQ(s.c_str(), "");
}

TEST(StringStrip, Strip)
{
	EXPECT_EQ(Strip(""sv), ""sv);
	EXPECT_EQ(Strip(" "sv), ""sv);
	EXPECT_EQ(Strip(" a b "sv), "a b"sv);
	EXPECT_EQ(Strip("\0a\0"sv), "a"sv);
}
