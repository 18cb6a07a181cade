// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "StringStrip.hxx"
#include "CharUtil.hxx"

#include <algorithm>
#include <iterator>

const char *
StripLeft(const char *p) noexcept
{
	while (IsWhitespaceNotNull(*p))
		++p;

	return p;
}

std::string_view
StripLeft(std::string_view s) noexcept
{
	/* unlike the C string overload, this skips null bytes */
	const auto i = std::find_if_not(s.begin(), s.end(), IsWhitespaceOrNull);
	return s.substr(std::distance(s.begin(), i));
}

std::string_view
StripRight(std::string_view s) noexcept
{
	auto length = s.size();
	while (length > 0 && IsWhitespaceOrNull(s[length - 1]))
		--length;

	return s.substr(0, length);
}

void
StripRight(char *p) noexcept
{
	p[StripRight(std::string_view{p}).size()] = 0;
}

std::string_view
Strip(std::string_view s) noexcept
{
	return StripRight(StripLeft(s));
}
