// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef VPLAY_CONFIG_CHECK_HXX
#define VPLAY_CONFIG_CHECK_HXX

struct ConfigData;

/**
 * Log a warning for each setting inside a block which was not
 * looked up by the block's owner; this is usually a typo.  Must be
 * called after the decoder plugins and the output have been
 * created.
 */
void
CheckUnusedOptions(const ConfigData &config_data) noexcept;

#endif
