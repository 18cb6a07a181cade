// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef VPLAY_PLAYER_STATUS_HXX
#define VPLAY_PLAYER_STATUS_HXX

#include "pcm/AudioFormat.hxx"

#include <cstdint>
#include <string>

enum class PlayerState : uint8_t {
	STOP,
	PAUSE,
	PLAY
};

[[gnu::const]]
const char *
ToString(PlayerState state) noexcept;

/**
 * A snapshot of the player's sink, taken by the player thread.
 */
struct PlayerStatus {
	/**
	 * STOP if the sink is empty, else PAUSE or PLAY.
	 */
	PlayerState state = PlayerState::STOP;

	/**
	 * The pause flag.  It may be set while the sink is empty.
	 */
	bool paused = false;

	/**
	 * The number of sources in the sink.
	 */
	unsigned queued = 0;

	/**
	 * The path of the source being played; empty if stopped.
	 */
	std::string path;

	/**
	 * The audio format of the source being played; undefined if
	 * stopped.
	 */
	AudioFormat audio_format = AudioFormat::Undefined();
};

#endif
