// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Interleave.hxx"
#include "Error.hxx"

extern "C" {
#include <libavutil/frame.h>
#include <libavutil/samplefmt.h>
}

#include <cstring>

namespace Ffmpeg {

std::span<const std::byte>
InterleaveFrame(const AVFrame &frame, std::vector<std::byte> &buffer)
{
	const auto format = AVSampleFormat(frame.format);
	const unsigned channels = frame.ch_layout.nb_channels;
	const std::size_t n_frames = frame.nb_samples;

	const int data_size =
		av_samples_get_buffer_size(nullptr, channels,
					   n_frames, format, 1);
	if (data_size < 0)
		throw MakeFfmpegError(data_size);

	if (data_size == 0)
		return {};

	const auto *src = (const std::byte *)frame.extended_data[0];

	if (!av_sample_fmt_is_planar(format) || channels == 1)
		return {src, std::size_t(data_size)};

	buffer.resize(data_size);

	const std::size_t sample_size = av_get_bytes_per_sample(format);
	std::byte *dest = buffer.data();
	for (std::size_t i = 0; i != n_frames; ++i) {
		for (unsigned c = 0; c != channels; ++c) {
			const auto *plane =
				(const std::byte *)frame.extended_data[c];
			std::memcpy(dest, plane + i * sample_size,
				    sample_size);
			dest += sample_size;
		}
	}

	return buffer;
}

} // namespace Ffmpeg
