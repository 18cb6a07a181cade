// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef VPLAY_ALSA_OUTPUT_PLUGIN_HXX
#define VPLAY_ALSA_OUTPUT_PLUGIN_HXX

extern const struct AudioOutputPlugin alsa_output_plugin;

#endif
