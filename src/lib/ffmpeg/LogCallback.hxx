// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include <cstdarg>

/**
 * An av_log_set_callback() implementation which forwards FFmpeg
 * messages to our logging library.
 */
void
FfmpegLogCallback(void *ptr, int level, const char *fmt, std::va_list vl);
