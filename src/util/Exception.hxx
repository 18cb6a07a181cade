// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#ifndef EXCEPTION_HXX
#define EXCEPTION_HXX

#include <exception>
#include <string>

/*
 * Error messages for the console and the log are built from the
 * whole chain of nested exceptions, e.g. "Failed to create audio
 * output \"alsa\" (alsa); Failed to open ALSA device ...".
 */

/**
 * Obtain the full concatenated message of an exception and its nested
 * chain.  Whitespace inside each message (including line breaks) is
 * collapsed to a single space.
 */
std::string
GetFullMessage(const std::exception &e,
	       const char *fallback="Unknown exception",
	       const char *separator="; ") noexcept;

/**
 * Extract the full message of a C++ exception pointer.
 */
std::string
GetFullMessage(std::exception_ptr ep,
	       const char *fallback="Unknown exception",
	       const char *separator="; ") noexcept;

#endif
