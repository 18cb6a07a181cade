// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef VPLAY_LOG_BACKEND_HXX
#define VPLAY_LOG_BACKEND_HXX

#include "LogLevel.hxx"

#include <string_view>

void
SetLogThreshold(LogLevel _threshold) noexcept;

[[gnu::pure]]
LogLevel
GetLogThreshold() noexcept;

/**
 * Prefix each line with the local time.  This is enabled when
 * logging to a file.
 */
void
EnableLogTimestamp() noexcept;

/**
 * Format the current local time the way it appears in log files.
 */
std::string_view
log_date() noexcept;

#endif
