// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "config.h"
#include "Registry.hxx"
#include "OutputPlugin.hxx"
#include "plugins/AlsaOutputPlugin.hxx"
#include "plugins/NullOutputPlugin.hxx"
#include "util/StringCompare.hxx"

constinit const AudioOutputPlugin *const audio_output_plugins[] = {
#ifdef ENABLE_ALSA
	&alsa_output_plugin,
#endif
	&null_output_plugin,
	nullptr
};

const AudioOutputPlugin *
GetAudioOutputPluginByName(const char *name) noexcept
{
	for (const auto *const*i = audio_output_plugins; *i != nullptr; ++i)
		if (StringIsEqual((*i)->name, name))
			return *i;

	return nullptr;
}
