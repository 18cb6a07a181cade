// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "OptionParser.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "util/StringCompare.hxx"

inline OptionParser::Result
OptionParser::IdentifyOption(const char *s) const
{
	assert(s != nullptr);
	assert(*s == '-');

	if (s[1] == '-') {
		for (const auto &i : options)
			if (i.HasLongOption() &&
			    StringIsEqual(s + 2, i.GetLongOption()))
				return {int(&i - options.data())};
	} else if (s[1] != 0 && s[2] == 0) {
		const char ch = s[1];
		for (const auto &i : options)
			if (i.HasShortOption() && ch == i.GetShortOption())
				return {int(&i - options.data())};
	}

	throw FmtRuntimeError("Unknown option: {}", s);
}

OptionParser::Result
OptionParser::Next()
{
	while (position < args.size()) {
		const char *arg = args[position++];
		if (arg[0] == '-' && arg[1] != 0)
			return IdentifyOption(arg);

		remaining.push_back(arg);
	}

	return {-1};
}
