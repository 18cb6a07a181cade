// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef VPLAY_PLAYER_COMMAND_HXX
#define VPLAY_PLAYER_COMMAND_HXX

#include "Status.hxx"
#include "thread/Future.hxx"

#include <optional>
#include <string>
#include <variant>

/**
 * Replace the sink contents with the given file.  If a #Promise is
 * attached, the player thread fulfils it exactly once, before it
 * handles the next command.
 */
struct PlayCommand {
	std::string path;
	std::optional<Promise<void>> result;
};

/**
 * Stop playback, clear the sink and reset the pause flag.
 */
struct StopCommand {};

/**
 * Toggle the pause flag.
 */
struct PauseCommand {};

/**
 * Reply with a #PlayerStatus snapshot.
 */
struct StatusCommand {
	Promise<PlayerStatus> result;
};

using PlayerCommand = std::variant<PlayCommand, StopCommand,
				   PauseCommand, StatusCommand>;

#endif
