// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "Tokenizer.hxx"
#include "CharUtil.hxx"
#include "StringStrip.hxx"

#include <stdexcept>

static constexpr bool
valid_word_char(char ch) noexcept
{
	return IsAlphaNumericASCII(ch) || ch == '_';
}

static constexpr bool
valid_unquoted_char(char ch) noexcept
{
	return (unsigned char)ch > 0x20 && ch != '"' && ch != '\'';
}

inline void
Tokenizer::EndToken() noexcept
{
	if (*input != 0) {
		*input = 0;
		input = StripLeft(input + 1);
	}
}

char *
Tokenizer::NextWord()
{
	char *const word = input;

	if (*input == 0)
		return nullptr;

	if (!IsAlphaASCII(*input))
		throw std::runtime_error("Letter expected");

	while (*++input != 0 && !IsWhitespaceNotNull(*input))
		if (!valid_word_char(*input))
			throw std::runtime_error("Invalid word character");

	EndToken();
	return word;
}

char *
Tokenizer::NextUnquoted()
{
	char *const word = input;

	if (*input == 0)
		return nullptr;

	if (!valid_unquoted_char(*input))
		throw std::runtime_error("Invalid unquoted character");

	while (*++input != 0 && !IsWhitespaceNotNull(*input))
		if (!valid_unquoted_char(*input))
			throw std::runtime_error("Invalid unquoted character");

	EndToken();
	return word;
}

char *
Tokenizer::NextString()
{
	char *const word = input, *dest = input;

	if (*input == 0)
		/* end of line */
		return nullptr;

	if (*input != '"')
		throw std::runtime_error("'\"' expected");

	++input;

	while (*input != '"') {
		if (*input == '\\')
			/* the backslash escapes the following
			   character */
			++input;

		if (*input == 0)
			throw std::runtime_error("Missing closing '\"'");

		*dest++ = *input++;
	}

	/* the closing quote must be followed by whitespace or the end
	   of the line */

	++input;
	if (!IsWhitespaceOrNull(*input))
		throw std::runtime_error("Space expected after closing '\"'");

	*dest = 0;
	input = StripLeft(input);
	return word;
}

char *
Tokenizer::NextParam()
{
	if (*input == '"')
		return NextString();
	else
		return NextUnquoted();
}
