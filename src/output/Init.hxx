// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef VPLAY_OUTPUT_INIT_HXX
#define VPLAY_OUTPUT_INIT_HXX

#include <memory>

struct ConfigBlock;
class AudioOutput;

/**
 * Create an #AudioOutput from an "audio_output" block.  A null
 * block (no "audio_output" in the configuration file) selects the
 * default plugin.
 *
 * Throws on error.
 */
std::unique_ptr<AudioOutput>
audio_output_new(const ConfigBlock &block);

#endif
