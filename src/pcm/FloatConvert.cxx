// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "FloatConvert.hxx"
#include "lib/fmt/RuntimeError.hxx"

#include <algorithm>

#include <string.h>

template<typename SV, typename F>
static void
AppendConverted(std::vector<float> &dest, std::span<const std::byte> src,
		F convert) noexcept
{
	const std::size_t n = src.size() / sizeof(SV);
	const std::size_t old_size = dest.size();
	dest.resize(old_size + n);

	float *out = dest.data() + old_size;
	for (std::size_t i = 0; i < n; ++i) {
		/* memcpy() because decoder buffers need not be
		   aligned */
		SV value;
		memcpy(&value, src.data() + i * sizeof(SV), sizeof(value));
		out[i] = convert(value);
	}
}

template<typename SV, unsigned BITS>
static void
AppendInteger(std::vector<float> &dest,
	      std::span<const std::byte> src) noexcept
{
	AppendConverted<SV>(dest, src,
			    IntegerToFloatSampleConvert<SV, BITS>::Convert);
}

void
PcmAppendFloat(std::vector<float> &dest, SampleFormat format,
	       std::span<const std::byte> src)
{
	const unsigned sample_size = sample_format_size(format);
	if (sample_size == 0)
		throw FmtInvalidArgument("Unsupported sample format: {}",
					 sample_format_to_string(format));

	if (src.size() % sample_size != 0)
		throw FmtInvalidArgument("Partial sample in {} byte buffer",
					 src.size());

	switch (format) {
	case SampleFormat::UNDEFINED:
		break;

	case SampleFormat::S8:
		AppendInteger<int8_t, 8>(dest, src);
		return;

	case SampleFormat::S16:
		AppendInteger<int16_t, 16>(dest, src);
		return;

	case SampleFormat::S24_P32:
		AppendInteger<int32_t, 24>(dest, src);
		return;

	case SampleFormat::S32:
		AppendInteger<int32_t, 32>(dest, src);
		return;

	case SampleFormat::FLOAT:
		AppendConverted<float>(dest, src, [](float value){
			return std::clamp(value, -1.0f, 1.0f);
		});
		return;
	}
}
