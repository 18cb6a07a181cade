// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include "pcm/SampleFormat.hxx"

extern "C" {
#include <libavutil/samplefmt.h>
}

namespace Ffmpeg {

/**
 * Convert an FFmpeg sample format to ours.  Planar formats map to
 * their packed counterpart; InterleaveFrame() takes care of the
 * layout.
 *
 * @return SampleFormat::UNDEFINED if the format is not supported
 */
[[gnu::const]]
static inline SampleFormat
FromFfmpegSampleFormat(AVSampleFormat sample_fmt) noexcept
{
	switch (sample_fmt) {
	case AV_SAMPLE_FMT_S16:
	case AV_SAMPLE_FMT_S16P:
		return SampleFormat::S16;

	case AV_SAMPLE_FMT_S32:
	case AV_SAMPLE_FMT_S32P:
		return SampleFormat::S32;

	case AV_SAMPLE_FMT_FLT:
	case AV_SAMPLE_FMT_FLTP:
		return SampleFormat::FLOAT;

	default:
		return SampleFormat::UNDEFINED;
	}
}

} // namespace Ffmpeg
