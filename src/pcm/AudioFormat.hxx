// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef VPLAY_AUDIO_FORMAT_HXX
#define VPLAY_AUDIO_FORMAT_HXX

#include "SampleFormat.hxx" // IWYU pragma: export

#include <cstddef>
#include <cstdint>

template<std::size_t CAPACITY> class StringBuffer;

static constexpr unsigned MAX_CHANNELS = 8;

/**
 * Checks whether the number of channels is valid.
 */
constexpr bool
audio_valid_channel_count(unsigned channels) noexcept
{
	return channels >= 1 && channels <= MAX_CHANNELS;
}

/**
 * Checks whether the sample rate is valid.
 *
 * @param sample_rate the sample rate in Hz
 */
constexpr bool
audio_valid_sample_rate(unsigned long sample_rate) noexcept
{
	return sample_rate > 0 && sample_rate < (1 << 30);
}

/**
 * This structure describes the format of a raw PCM stream.
 */
struct AudioFormat {
	/**
	 * The sample rate in Hz.  A better name for this attribute is
	 * "frame rate", because technically, you have two samples per
	 * frame in stereo sound.
	 */
	uint32_t sample_rate;

	/**
	 * The format samples are stored in.
	 */
	SampleFormat format;

	/**
	 * The number of channels.  Samples are interleaved, one
	 * sample of each channel per frame.
	 */
	uint8_t channels;

	AudioFormat() noexcept = default;

	constexpr AudioFormat(uint32_t _sample_rate,
			      SampleFormat _format, uint8_t _channels) noexcept
		:sample_rate(_sample_rate),
		 format(_format), channels(_channels) {}

	static constexpr AudioFormat Undefined() noexcept {
		return AudioFormat(0, SampleFormat::UNDEFINED, 0);
	}

	void Clear() noexcept {
		sample_rate = 0;
		format = SampleFormat::UNDEFINED;
		channels = 0;
	}

	/**
	 * Checks whether the object has a defined value.
	 */
	constexpr bool IsDefined() const noexcept {
		return sample_rate != 0;
	}

	constexpr bool IsValid() const noexcept {
		return audio_valid_sample_rate(sample_rate) &&
			audio_valid_sample_format(format) &&
			audio_valid_channel_count(channels);
	}

	constexpr bool operator==(const AudioFormat other) const noexcept {
		return sample_rate == other.sample_rate &&
			format == other.format &&
			channels == other.channels;
	}

	constexpr bool operator!=(const AudioFormat other) const noexcept {
		return !(*this == other);
	}

	/**
	 * Returns the size of each (mono) sample in bytes.
	 */
	constexpr unsigned GetSampleSize() const noexcept {
		return sample_format_size(format);
	}

	/**
	 * Returns the size of each full frame in bytes.
	 */
	constexpr unsigned GetFrameSize() const noexcept {
		return GetSampleSize() * channels;
	}

	template<typename D>
	constexpr auto TimeToFrames(D t) const noexcept {
		using Period = typename D::period;
		return ((t.count() * sample_rate) / Period::den) * Period::num;
	}

	template<typename D>
	constexpr std::size_t TimeToSize(D t) const noexcept {
		return std::size_t(std::size_t(TimeToFrames(t)) * GetFrameSize());
	}

	template<typename D>
	constexpr D FramesToTime(std::uintmax_t size) const noexcept {
		using Rep = typename D::rep;
		using Period = typename D::period;
		return D(((Rep(1) * size / Period::num) * Period::den) / sample_rate);
	}

	template<typename D>
	constexpr D SizeToTime(std::uintmax_t size) const noexcept {
		return FramesToTime<D>(size / GetFrameSize());
	}
};

/**
 * Renders the #AudioFormat object into a string, e.g. for printing
 * it in a log file.  The format is "RATE:FORMAT:CHANNELS", for
 * example "44100:f:2"; undefined attributes are rendered as "*".
 */
[[gnu::const]]
StringBuffer<24>
ToString(AudioFormat af) noexcept;

#endif
