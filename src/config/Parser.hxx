// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef VPLAY_CONFIG_PARSER_HXX
#define VPLAY_CONFIG_PARSER_HXX

#include <chrono>

/**
 * Parse a boolean value ("yes"/"no", "true"/"false", "1"/"0").
 *
 * Throws on error.
 */
bool
ParseBool(const char *value);

/**
 * Throws on error.
 */
long
ParseLong(const char *s);

/**
 * Throws on error.
 */
unsigned
ParseUnsigned(const char *s);

/**
 * Same as ParseUnsigned(), but rejects zero.
 *
 * Throws on error.
 */
unsigned
ParsePositive(const char *s);

/**
 * Parse a duration.  A plain number is in seconds; the suffixes
 * "ms", "s" and "min" select other units.
 *
 * Throws on error.
 */
std::chrono::steady_clock::duration
ParseDuration(const char *s);

#endif
