// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef VPLAY_CONFIG_OPTION_HXX
#define VPLAY_CONFIG_OPTION_HXX

/**
 * The top-level settings of vplay.conf.
 */
enum class ConfigOption {
	/**
	 * Path of the log file; without it, vplay logs to stderr.
	 */
	LOG_FILE,

	LOG_LEVEL,

	/**
	 * How long a console command waits for the player thread.
	 */
	PLAY_TIMEOUT,

	MAX
};

/**
 * The sections of vplay.conf.
 */
enum class ConfigBlockOption {
	AUDIO_OUTPUT,
	DECODER,
	MAX
};

/**
 * @return #ConfigOption::MAX if not found
 */
[[gnu::pure]]
ConfigOption
ParseConfigOptionName(const char *name) noexcept;

/**
 * @return #ConfigBlockOption::MAX if not found
 */
[[gnu::pure]]
ConfigBlockOption
ParseConfigBlockOptionName(const char *name) noexcept;

#endif
