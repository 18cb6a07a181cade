// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef VPLAY_DECODER_CLIENT_HXX
#define VPLAY_DECODER_CLIENT_HXX

#include "Command.hxx"

#include <cstddef>
#include <span>

struct AudioFormat;

/**
 * An interface between the decoder plugin and the object which
 * collects its output.
 */
class DecoderClient {
public:
	/**
	 * Notify the client that it has finished parsing the stream
	 * headers.  Must be called exactly once, before the first
	 * SubmitAudio() call.
	 *
	 * Throws on error.
	 *
	 * @param audio_format the audio format which is going to be
	 * sent to SubmitAudio()
	 */
	virtual void Ready(AudioFormat audio_format) = 0;

	/**
	 * This function is called by decoder plugins when they have
	 * decoded a chunk of interleaved PCM data in the format which
	 * was announced by Ready().  It blocks while the consumer's
	 * buffer is full.
	 *
	 * Throws on error.
	 *
	 * @return DecoderCommand::STOP if the plugin shall stop
	 * decoding, DecoderCommand::NONE otherwise
	 */
	virtual DecoderCommand SubmitAudio(std::span<const std::byte> audio) = 0;

	template<typename T, std::size_t extent>
	DecoderCommand SubmitAudio(std::span<T, extent> audio) {
		const std::span<const std::byte> audio_bytes =
			std::as_bytes(audio);
		return SubmitAudio(audio_bytes);
	}
};

#endif
