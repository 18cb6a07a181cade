// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "OutputPlugin.hxx"
#include "Interface.hxx"

#include <cassert>

std::unique_ptr<AudioOutput>
ao_plugin_init(const AudioOutputPlugin &plugin, const ConfigBlock &block)
{
	assert(plugin.init != nullptr);

	return std::unique_ptr<AudioOutput>(plugin.init(block));
}
