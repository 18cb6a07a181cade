// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef VPLAY_UTIL_OPTIONPARSER_HXX
#define VPLAY_UTIL_OPTIONPARSER_HXX

#include "OptionDef.hxx"

#include <cstddef>
#include <span>
#include <vector>

/**
 * Command line option parser.
 */
class OptionParser
{
	std::span<const OptionDef> options;
	std::span<const char *const> args;

	std::size_t position = 0;

	std::vector<const char *> remaining;

public:
	OptionParser(std::span<const OptionDef> _options,
		     int _argc, const char *const*_argv) noexcept
		:options(_options),
		 args(_argv + 1, std::size_t(_argc - 1)) {}

	struct Result {
		/**
		 * The index in the #OptionDef array, or -1 at the end
		 * of the command line.
		 */
		int index;

		constexpr operator bool() const noexcept {
			return index >= 0;
		}
	};

	/**
	 * Find the next option.  Non-option arguments are collected
	 * and can be obtained with GetRemaining() after this method
	 * has returned an empty result.
	 *
	 * Throws on error.
	 */
	Result Next();

	/**
	 * Returns the non-option arguments.
	 */
	std::span<const char *const> GetRemaining() const noexcept {
		return remaining;
	}

private:
	Result IdentifyOption(const char *s) const;
};

#endif
