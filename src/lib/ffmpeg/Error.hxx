// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include <stdexcept>

/**
 * Construct an exception from an FFmpeg error code, with the
 * message obtained from av_strerror().
 */
std::runtime_error
MakeFfmpegError(int errnum);

std::runtime_error
MakeFfmpegError(int errnum, const char *prefix);
