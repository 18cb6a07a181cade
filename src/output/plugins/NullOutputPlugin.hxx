// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef VPLAY_NULL_OUTPUT_PLUGIN_HXX
#define VPLAY_NULL_OUTPUT_PLUGIN_HXX

extern const struct AudioOutputPlugin null_output_plugin;

#endif
