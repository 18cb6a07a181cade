// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef VPLAY_PCM_FLOAT_CONVERT_HXX
#define VPLAY_PCM_FLOAT_CONVERT_HXX

#include "SampleFormat.hxx"

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

/**
 * Convert from an integer sample format with the given number of
 * significant bits to float.
 */
template<typename SV, unsigned BITS>
struct IntegerToFloatSampleConvert {
	static constexpr float factor = 1.0f / float(uintmax_t(1) << (BITS - 1));
	static_assert(factor > 0, "Wrong factor");

	static constexpr float Convert(SV src) noexcept {
		return float(src) * factor;
	}
};

/**
 * Convert interleaved samples of the given format to 32 bit float
 * and append them to #dest.
 *
 * Throws #std::invalid_argument if the format is not supported or
 * if #src is not a whole number of samples.
 */
void
PcmAppendFloat(std::vector<float> &dest, SampleFormat format,
	       std::span<const std::byte> src);

#endif
