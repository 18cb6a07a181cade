// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Init.hxx"
#include "Interface.hxx"
#include "OutputPlugin.hxx"
#include "Registry.hxx"
#include "Domain.hxx"
#include "config/Block.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "Log.hxx"

#include <cassert>
#include <stdexcept>

#define AUDIO_OUTPUT_TYPE	"type"
#define AUDIO_OUTPUT_NAME	"name"

std::unique_ptr<AudioOutput>
audio_output_new(const ConfigBlock &block)
{
	const AudioOutputPlugin *plugin;

	block.SetUsed();

	if (!block.IsNull()) {
		const char *p;

		p = block.GetBlockValue(AUDIO_OUTPUT_TYPE);
		if (p == nullptr)
			throw std::runtime_error("Missing \"type\" configuration");

		plugin = GetAudioOutputPluginByName(p);
		if (plugin == nullptr)
			throw FmtRuntimeError("No such audio output plugin: {}", p);
	} else {
		plugin = audio_output_plugins[0];
		assert(plugin != nullptr);

		FmtDebug(output_domain,
			 "No 'audio_output' defined in config file, using '{}'",
			 plugin->name);
	}

	const char *name = block.GetBlockValue(AUDIO_OUTPUT_NAME,
					       plugin->name);

	try {
		auto ao = ao_plugin_init(*plugin, block);
		assert(ao != nullptr);

		FmtDebug(output_domain, "Created audio output \"{}\" ({})",
			 name, plugin->name);
		return ao;
	} catch (...) {
		std::throw_with_nested(FmtRuntimeError("Failed to create audio output \"{}\" ({})",
						       name, plugin->name));
	}
}
