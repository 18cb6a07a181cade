// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef VPLAY_PCM_SAMPLE_FORMAT_HXX
#define VPLAY_PCM_SAMPLE_FORMAT_HXX

#include <cstdint>

/**
 * The sample formats a decoder plugin may announce.  Everything is
 * converted to #FLOAT before it reaches the #Sink.
 */
enum class SampleFormat : uint8_t {
	UNDEFINED = 0,

	S8,
	S16,

	/**
	 * Signed 24 bit integer samples, packed in 32 bit integers
	 * (the most significant byte is filled with the sign bit).
	 * Produced by the FLAC decoder for 24 bit streams.
	 */
	S24_P32,

	S32,

	/**
	 * 32 bit floating point samples in the host's format, in the
	 * range -1.0f to +1.0f.
	 */
	FLOAT,
};

/**
 * @return the size of one sample in bytes, or 0 if the format is
 * not valid
 */
constexpr unsigned
sample_format_size(SampleFormat format) noexcept
{
	switch (format) {
	case SampleFormat::S8:
		return 1;

	case SampleFormat::S16:
		return 2;

	case SampleFormat::S24_P32:
	case SampleFormat::S32:
	case SampleFormat::FLOAT:
		return 4;

	case SampleFormat::UNDEFINED:
		break;
	}

	return 0;
}

constexpr bool
audio_valid_sample_format(SampleFormat format) noexcept
{
	return sample_format_size(format) != 0;
}

/**
 * Returns the notation used in "rate:format:channels" strings,
 * i.e. the bit depth or "f" for #SampleFormat::FLOAT.
 *
 * @return the string, or "?" if the format is not valid
 */
[[gnu::const]] [[gnu::returns_nonnull]]
constexpr const char *
sample_format_to_string(SampleFormat format) noexcept
{
	switch (format) {
	case SampleFormat::S8:
		return "8";

	case SampleFormat::S16:
		return "16";

	case SampleFormat::S24_P32:
		return "24";

	case SampleFormat::S32:
		return "32";

	case SampleFormat::FLOAT:
		return "f";

	case SampleFormat::UNDEFINED:
		break;
	}

	return "?";
}

#endif
