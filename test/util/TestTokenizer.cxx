// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "util/Tokenizer.hxx"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

TEST(Tokenizer, Words)
{
	std::string input = "audio_output  {  # comment";
	Tokenizer t(input.data());

	EXPECT_STREQ(t.NextWord(), "audio_output");
	EXPECT_EQ(t.CurrentChar(), '{');
	EXPECT_STREQ(t.Rest(), "{  # comment");
}

TEST(Tokenizer, BadWord)
{
	std::string input = "1abc";
	Tokenizer t(input.data());
	EXPECT_THROW(t.NextWord(), std::runtime_error);

	input = "ab-c";
	Tokenizer t2(input.data());
	EXPECT_THROW(t2.NextWord(), std::runtime_error);
}

TEST(Tokenizer, Strings)
{
	std::string input = R"("/tmp/a song.mp3"  "with \"quotes\"" "")";
	Tokenizer t(input.data());

	EXPECT_STREQ(t.NextString(), "/tmp/a song.mp3");
	EXPECT_STREQ(t.NextString(), R"(with "quotes")");
	EXPECT_STREQ(t.NextString(), "");
	EXPECT_TRUE(t.IsEnd());
	EXPECT_EQ(t.NextString(), nullptr);
}

TEST(Tokenizer, BadStrings)
{
	std::string input = "unquoted";
	EXPECT_THROW(Tokenizer(input.data()).NextString(), std::runtime_error);

	input = "\"unterminated";
	EXPECT_THROW(Tokenizer(input.data()).NextString(), std::runtime_error);

	input = "\"a\"b";
	EXPECT_THROW(Tokenizer(input.data()).NextString(), std::runtime_error);
}

TEST(Tokenizer, Params)
{
	std::string input = "play \"x y\" z";
	Tokenizer t(input.data());

	EXPECT_STREQ(t.NextParam(), "play");
	EXPECT_STREQ(t.NextParam(), "x y");
	EXPECT_STREQ(t.NextParam(), "z");
	EXPECT_EQ(t.NextParam(), nullptr);
}
