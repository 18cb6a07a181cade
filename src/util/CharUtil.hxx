// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#ifndef CHAR_UTIL_HXX
#define CHAR_UTIL_HXX

/*
 * Locale-independent character classes for parsing vplay.conf and
 * console commands.  Control characters count as whitespace.
 */

constexpr bool
IsWhitespaceOrNull(const char ch) noexcept
{
	return (unsigned char)ch <= 0x20;
}

constexpr bool
IsWhitespaceNotNull(const char ch) noexcept
{
	return ch != 0 && IsWhitespaceOrNull(ch);
}

constexpr bool
IsAlphaASCII(char ch) noexcept
{
	return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z');
}

constexpr bool
IsAlphaNumericASCII(char ch) noexcept
{
	return IsAlphaASCII(ch) || (ch >= '0' && ch <= '9');
}

/**
 * Unlike tolower(), this ignores the system locale.
 */
constexpr char
ToLowerASCII(char ch) noexcept
{
	return ch >= 'A' && ch <= 'Z'
		? char(ch - 'A' + 'a')
		: ch;
}

#endif
