// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "CheckAudioFormat.hxx"
#include "lib/fmt/RuntimeError.hxx"

#include <fmt/format.h>

#include <iterator>

AudioFormat
CheckAudioFormat(unsigned long sample_rate,
		 SampleFormat sample_format, unsigned channels)
{
	fmt::memory_buffer problems;
	auto out = std::back_inserter(problems);

	if (!audio_valid_sample_rate(sample_rate))
		fmt::format_to(out, "; sample rate {}", sample_rate);

	if (!audio_valid_sample_format(sample_format))
		fmt::format_to(out, "; sample format {}",
			       unsigned(sample_format));

	if (!audio_valid_channel_count(channels))
		fmt::format_to(out, "; {} channels (at most {})",
			       channels, MAX_CHANNELS);

	if (problems.size() > 0)
		/* skip the leading separator */
		throw FmtRuntimeError("Invalid audio format: {}",
				      fmt::string_view{problems.data() + 2,
						       problems.size() - 2});

	return AudioFormat(sample_rate, sample_format, channels);
}
