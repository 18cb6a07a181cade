// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Init.hxx"
#include "LogCallback.hxx"

extern "C" {
#include <libavutil/log.h>
}

void
FfmpegInit() noexcept
{
	av_log_set_callback(FfmpegLogCallback);
}
