// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef VPLAY_CONFIG_FILE_HXX
#define VPLAY_CONFIG_FILE_HXX

struct ConfigData;

/**
 * Load a configuration file and add its settings to #data.
 *
 * Throws on error.
 */
void
ReadConfigFile(ConfigData &data, const char *path);

#endif
