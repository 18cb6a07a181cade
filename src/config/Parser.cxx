// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Parser.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "util/StringStrip.hxx"

#include <cstdlib>

#include <strings.h>

bool
ParseBool(const char *value)
{
	static const char *const t[] = { "yes", "true", "1" };
	static const char *const f[] = { "no", "false", "0" };

	for (const char *i : t)
		if (strcasecmp(i, value) == 0)
			return true;

	for (const char *i : f)
		if (strcasecmp(i, value) == 0)
			return false;

	throw FmtRuntimeError(R"(Not a valid boolean ("yes" or "no"): "{}")",
			      value);
}

long
ParseLong(const char *s)
{
	char *endptr;
	long value = strtol(s, &endptr, 10);
	if (endptr == s || *endptr != 0)
		throw std::runtime_error("Failed to parse number");

	return value;
}

unsigned
ParseUnsigned(const char *s)
{
	auto value = ParseLong(s);
	if (value < 0)
		throw std::runtime_error("Value must not be negative");

	return (unsigned)value;
}

unsigned
ParsePositive(const char *s)
{
	auto value = ParseLong(s);
	if (value <= 0)
		throw std::runtime_error("Value must be positive");

	return (unsigned)value;
}

std::chrono::steady_clock::duration
ParseDuration(const char *s)
{
	using namespace std::chrono;

	char *endptr;
	const long value = strtol(s, &endptr, 10);
	if (endptr == s)
		throw std::runtime_error("Failed to parse number");

	if (value < 0)
		throw std::runtime_error("Value must not be negative");

	const std::string_view suffix = StripLeft(std::string_view{endptr});
	if (suffix.empty() || suffix == "s")
		return duration_cast<steady_clock::duration>(seconds(value));
	else if (suffix == "ms")
		return duration_cast<steady_clock::duration>(milliseconds(value));
	else if (suffix == "min")
		return duration_cast<steady_clock::duration>(minutes(value));
	else
		throw FmtRuntimeError("Unknown duration suffix: \"{}\"", suffix);
}
