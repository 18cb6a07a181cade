// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "config.h"
#include "CommandLine.hxx"
#include "Console.hxx"
#include "Log.hxx"
#include "LogInit.hxx"
#include "config/Block.hxx"
#include "config/Check.hxx"
#include "config/Data.hxx"
#include "config/Option.hxx"
#include "decoder/DecoderList.hxx"
#include "output/Init.hxx"
#include "output/Interface.hxx"
#include "player/Engine.hxx"
#include "player/Handle.hxx"
#include "io/FdReader.hxx"
#include "util/ScopeExit.hxx"

#include <chrono>

#include <signal.h>
#include <stdio.h>
#include <stdlib.h>
#include <unistd.h>

static constexpr std::chrono::steady_clock::duration default_play_timeout =
	std::chrono::seconds(10);

/**
 * Create the #AudioOutput described by the first "audio_output"
 * block, or the default one.  Runs in the player thread.
 */
static std::unique_ptr<AudioOutput>
CreateAudioOutput(const ConfigData &config)
{
	const auto *block = config.GetBlock(ConfigBlockOption::AUDIO_OUTPUT);
	if (block != nullptr)
		return audio_output_new(*block);

	return audio_output_new(ConfigBlock{});
}

static int
vplay_main(int argc, char *argv[])
{
	CommandLineOptions options;
	ConfigData config;

	ParseCommandLine(argc, argv, options, config);

	log_init(config, options.verbose, options.log_stderr);

	/* a closed client must not kill us */
	signal(SIGPIPE, SIG_IGN);

	const ScopeDecoderPluginsInit decoder_plugins_init(config);

	const auto play_timeout =
		config.GetDuration(ConfigOption::PLAY_TIMEOUT,
				   std::chrono::milliseconds(1),
				   default_play_timeout);

	AudioEngine engine([&config]{ return CreateAudioOutput(config); },
			   FormatDispatcher::FromDecoderList(),
			   play_timeout);

	{
		auto player = engine.Start();

		/* the output has been created by now */
		CheckUnusedOptions(config);

		FdReader input(STDIN_FILENO);
		RunConsole(input, stdout, player);
	}

	/* the last PlayerHandle is gone; this lets the player
	   thread finish */
	engine.Join();

	return EXIT_SUCCESS;
}

int
main(int argc, char *argv[]) noexcept
try {
	AtScopeExit() { log_deinit(); };

	return vplay_main(argc, argv);
} catch (...) {
	LogError(std::current_exception());
	return EXIT_FAILURE;
}
