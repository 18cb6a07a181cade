// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef VPLAY_UTIL_OPTIONDEF_HXX
#define VPLAY_UTIL_OPTIONDEF_HXX

#include <cassert>

/**
 * Command line option definition.  Options don't take values.
 */
class OptionDef
{
	const char *long_option;
	char short_option;
	const char *desc;

public:
	constexpr OptionDef(const char *_long_option, const char *_desc) noexcept
		:long_option(_long_option),
		 short_option(0),
		 desc(_desc) {}

	constexpr OptionDef(const char *_long_option,
			    char _short_option, const char *_desc) noexcept
		:long_option(_long_option),
		 short_option(_short_option),
		 desc(_desc) {}

	constexpr bool HasLongOption() const noexcept {
		return long_option != nullptr;
	}

	constexpr bool HasShortOption() const noexcept {
		return short_option != 0;
	}

	constexpr bool HasDescription() const noexcept {
		return desc != nullptr;
	}

	const char *GetLongOption() const noexcept {
		assert(HasLongOption());
		return long_option;
	}

	char GetShortOption() const noexcept {
		assert(HasShortOption());
		return short_option;
	}

	const char *GetDescription() const noexcept {
		assert(HasDescription());
		return desc;
	}
};

#endif
