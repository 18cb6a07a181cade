// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef VPLAY_OUTPUT_REGISTRY_HXX
#define VPLAY_OUTPUT_REGISTRY_HXX

struct AudioOutputPlugin;

/**
 * A nullptr-terminated list of all compiled-in output plugins.  The
 * first one ("alsa" if available, else "null") is used if vplay.conf
 * has no "audio_output" block.
 */
extern const AudioOutputPlugin *const audio_output_plugins[];

/**
 * Look up the plugin named by the "type" setting.
 *
 * @return nullptr if there is no such plugin
 */
[[gnu::pure]]
const AudioOutputPlugin *
GetAudioOutputPluginByName(const char *name) noexcept;

#endif
