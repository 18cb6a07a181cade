// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef VPLAY_LOG_LEVEL_HXX
#define VPLAY_LOG_LEVEL_HXX

/**
 * The severity of a log message.  Messages below the threshold
 * ("log_level" in vplay.conf, default "notice") are discarded.
 */
enum class LogLevel {
	/**
	 * Player and decoder internals; enabled by "verbose" or
	 * "--verbose".
	 */
	DEBUG,

	/**
	 * Engine start/stop and the file being played.
	 */
	INFO,

	NOTICE,

	/**
	 * A file failed to play or a setting is wrong, but vplay
	 * continues.
	 */
	WARNING,

	/**
	 * An output or engine failure.
	 */
	ERROR,
};

#endif
