// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "config.h"
#include "DecoderList.hxx"
#include "DecoderPlugin.hxx"
#include "Domain.hxx"
#include "PluginUnavailable.hxx"
#include "config/Data.hxx"
#include "config/Block.hxx"
#include "lib/fmt/ExceptionFormatter.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "Log.hxx"

#include "plugins/Mpg123DecoderPlugin.hxx"
#include "plugins/VorbisDecoderPlugin.hxx"
#include "plugins/FlacDecoderPlugin.hxx"
#include "plugins/SndfileDecoderPlugin.hxx"
#include "plugins/FfmpegDecoderPlugin.hxx"

#include <iterator>

#include <string.h>

constinit const struct DecoderPlugin *const decoder_plugins[] = {
#ifdef ENABLE_MPG123
	&mpg123_decoder_plugin,
#endif
#ifdef ENABLE_VORBIS_DECODER
	&vorbis_decoder_plugin,
#endif
#ifdef ENABLE_FLAC
	&flac_decoder_plugin,
#endif
#ifdef ENABLE_SNDFILE
	&sndfile_decoder_plugin,
#endif
#ifdef ENABLE_FFMPEG
	&ffmpeg_decoder_plugin,
#endif
	nullptr
};

static constexpr unsigned num_decoder_plugins =
	std::size(decoder_plugins) - 1;

/** which plugins have been initialized successfully? */
bool decoder_plugins_enabled[num_decoder_plugins + 1];

void
decoder_plugin_init_all(const ConfigData &config)
{
	ConfigBlock empty;

	for (unsigned i = 0; decoder_plugins[i] != nullptr; ++i) {
		const DecoderPlugin &plugin = *decoder_plugins[i];
		const auto *param =
			config.FindBlock(ConfigBlockOption::DECODER, "plugin",
					 plugin.name);

		if (param == nullptr)
			param = &empty;
		else if (!param->GetBlockValue("enabled", true))
			/* the plugin is disabled in vplay.conf */
			continue;

		param->SetUsed();

		try {
			if (plugin.Init(*param))
				decoder_plugins_enabled[i] = true;
		} catch (const PluginUnavailable &) {
			FmtError(decoder_domain,
				 "Decoder plugin '{}' is unavailable: {}",
				 plugin.name, std::current_exception());
		} catch (...) {
			std::throw_with_nested(FmtRuntimeError("Failed to initialize decoder plugin '{}'",
							       plugin.name));
		}
	}
}

void
decoder_plugin_deinit_all() noexcept
{
	decoder_plugins_for_each_enabled([](const DecoderPlugin &plugin){
		plugin.Finish();
	});

	for (auto &i : decoder_plugins_enabled)
		i = false;
}
