// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef VPLAY_CHECK_AUDIO_FORMAT_HXX
#define VPLAY_CHECK_AUDIO_FORMAT_HXX

#include "AudioFormat.hxx"

/**
 * Validate the attributes reported by a decoder library and
 * construct an #AudioFormat object.  The error message names every
 * invalid attribute.
 *
 * Throws #std::runtime_error on error.
 */
AudioFormat
CheckAudioFormat(unsigned long sample_rate,
		 SampleFormat sample_format, unsigned channels);

/**
 * Like CheckAudioFormat(), but for a decoder which reports only its
 * own native sample format.
 */
static inline AudioFormat
CheckAudioFormat(unsigned long sample_rate, unsigned channels,
		 SampleFormat native_format=SampleFormat::S16)
{
	return CheckAudioFormat(sample_rate, native_format, channels);
}

#endif
