// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef VPLAY_PLAYER_SOURCE_BUILDER_HXX
#define VPLAY_PLAYER_SOURCE_BUILDER_HXX

#include "decoder/Client.hxx"
#include "pcm/AudioFormat.hxx"

#include <cstddef>
#include <vector>

class Source;

/**
 * The #DecoderClient implementation used by the decoder thread of a
 * #Source.  It converts the decoder output to 32 bit float and cuts
 * it into chunks for the pipe.
 */
class SourceBuilder final : public DecoderClient {
	Source &source;

	/**
	 * The format announced by the decoder.
	 */
	AudioFormat in_format = AudioFormat::Undefined();

	/**
	 * The number of float samples in one chunk.
	 */
	std::size_t chunk_samples;

	/**
	 * Converted samples which do not fill a chunk yet.
	 */
	std::vector<float> pending;

	/**
	 * Has the #Source asked the decoder to stop?
	 */
	bool stopped = false;

public:
	explicit SourceBuilder(Source &_source) noexcept
		:source(_source) {}

	/**
	 * Has the decoder called Ready()?
	 */
	bool IsReady() const noexcept {
		return in_format.IsDefined();
	}

	/**
	 * Push the last partial chunk to the pipe.  Called after the
	 * plugin has returned.
	 */
	void Flush();

	/* virtual methods from class DecoderClient */
	void Ready(AudioFormat audio_format) override;
	DecoderCommand SubmitAudio(std::span<const std::byte> audio) override;
};

#endif
