// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#ifndef STRING_COMPARE_HXX
#define STRING_COMPARE_HXX

#include <string_view>

#include <string.h>
#include <strings.h>

[[gnu::pure]] [[gnu::nonnull]]
static inline bool
StringIsEmpty(const char *string) noexcept
{
	return *string == 0;
}

[[gnu::pure]] [[gnu::nonnull]]
static inline bool
StringIsEqual(const char *a, const char *b) noexcept
{
	return strcmp(a, b) == 0;
}

[[gnu::pure]]
static inline bool
StringIsEqualIgnoreCase(std::string_view a, std::string_view b) noexcept
{
	return a.size() == b.size() &&
		strncasecmp(a.data(), b.data(), a.size()) == 0;
}

#endif
