// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef VPLAY_DECODER_COMMAND_HXX
#define VPLAY_DECODER_COMMAND_HXX

#include <cstdint>

/**
 * What the consumer wants a decoder plugin to do after it has
 * submitted a chunk.
 */
enum class DecoderCommand : uint8_t {
	/**
	 * Continue decoding.
	 */
	NONE = 0,

	/**
	 * The source has been discarded; return from
	 * DecoderPlugin::file_decode() as soon as possible.
	 */
	STOP,
};

#endif
