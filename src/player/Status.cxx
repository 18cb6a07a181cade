// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Status.hxx"

const char *
ToString(PlayerState state) noexcept
{
	switch (state) {
	case PlayerState::STOP:
		return "stop";

	case PlayerState::PAUSE:
		return "pause";

	case PlayerState::PLAY:
		return "play";
	}

	return "unknown";
}
