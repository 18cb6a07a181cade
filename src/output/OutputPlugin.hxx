// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef VPLAY_OUTPUT_PLUGIN_HXX
#define VPLAY_OUTPUT_PLUGIN_HXX

#include <memory>

struct ConfigBlock;
class AudioOutput;

/**
 * A plugin which controls an audio output device.
 */
struct AudioOutputPlugin {
	/**
	 * the plugin's name
	 */
	const char *name;

	/**
	 * Configure and initialize the device, but do not open it
	 * yet.
	 *
	 * Throws on error.
	 *
	 * @param block the configuration section for this output
	 */
	AudioOutput *(*init)(const ConfigBlock &block);
};

/**
 * Throws on error.
 */
std::unique_ptr<AudioOutput>
ao_plugin_init(const AudioOutputPlugin &plugin, const ConfigBlock &block);

#endif
