// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "config.h"
#include "CommandLine.hxx"
#include "LogInit.hxx"
#include "Log.hxx"
#include "config/File.hxx"
#include "config/Path.hxx"
#include "decoder/DecoderList.hxx"
#include "decoder/DecoderPlugin.hxx"
#include "output/Registry.hxx"
#include "output/OutputPlugin.hxx"
#include "util/Domain.hxx"
#include "util/OptionDef.hxx"
#include "util/OptionParser.hxx"

#include <stdexcept>
#include <string>

#include <stdio.h>
#include <stdlib.h>
#include <sys/stat.h>

enum Option {
	OPTION_NO_CONFIG,
	OPTION_STDERR,
	OPTION_VERBOSE,
	OPTION_VERSION,
	OPTION_HELP,
	OPTION_HELP2,
};

static constexpr OptionDef option_defs[] = {
	{"no-config", "don't read from config"},
	{"stderr", "print messages to stderr"},
	{"verbose", 'v', "verbose logging"},
	{"version", 'V', "print version number"},
	{"help", 'h', "show help options"},
	{nullptr, '?', nullptr}, // hidden, standard alias for --help
};

static constexpr Domain cmdline_domain("cmdline");

[[noreturn]]
static void version()
{
	printf(PACKAGE " " VERSION "\n"
	       "This is free software; see the source for copying conditions.  There is NO\n"
	       "warranty; not even MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.\n"
	       "\n"
	       "Decoder plugins:\n");

	for (unsigned i = 0; decoder_plugins[i] != nullptr; ++i) {
		const DecoderPlugin &plugin = *decoder_plugins[i];
		printf(" [%s]", plugin.name);

		const char *const*suffixes = plugin.suffixes;
		if (suffixes != nullptr)
			for (; *suffixes != nullptr; ++suffixes)
				printf(" %s", *suffixes);

		printf("\n");
	}

	printf("\n"
	       "Output plugins:\n");
	for (const auto *const*i = audio_output_plugins; *i != nullptr; ++i)
		printf(" %s", (*i)->name);
	printf("\n");

	std::exit(EXIT_SUCCESS);
}

static void PrintOption(const OptionDef &opt)
{
	if (opt.HasShortOption())
		printf("  -%c, --%-12s%s\n",
		       opt.GetShortOption(),
		       opt.GetLongOption(),
		       opt.GetDescription());
	else
		printf("  --%-16s%s\n",
		       opt.GetLongOption(),
		       opt.GetDescription());
}

[[noreturn]]
static void help()
{
	printf("Usage:\n"
	       "  vplay [OPTION...] [path/to/vplay.conf]\n"
	       "\n"
	       "Plays audio files; reads commands from standard input.\n"
	       "\n"
	       "Commands:\n"
	       "  play PATH, stop, pause, status, quit\n"
	       "\n"
	       "Options:\n");

	for (const auto &i : option_defs)
		if (i.HasDescription())
			PrintOption(i);

	std::exit(EXIT_SUCCESS);
}

[[gnu::pure]]
static bool
FileExists(const std::string &path) noexcept
{
	struct stat st;
	return stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

class ConfigLoader
{
	ConfigData &config;

public:
	explicit ConfigLoader(ConfigData &_config) noexcept
		:config(_config) {}

	bool TryFile(const std::string &path);
	bool TryFile(const std::string &base_path, const char *path);
};

bool ConfigLoader::TryFile(const std::string &path)
{
	if (FileExists(path)) {
		FmtDebug(cmdline_domain, "loading {}", path);
		ReadConfigFile(config, path.c_str());
		return true;
	}
	return false;
}

bool ConfigLoader::TryFile(const std::string &base_path, const char *path)
{
	if (base_path.empty())
		return false;

	return TryFile(base_path + "/" + path);
}

/**
 * Returns $XDG_CONFIG_HOME, falling back to ~/.config.
 */
static std::string
GetUserConfigDir() noexcept
{
	if (const char *xdg = getenv("XDG_CONFIG_HOME");
	    xdg != nullptr && *xdg == '/')
		return xdg;

	auto home = GetHomeDir();
	if (home.empty())
		return home;

	return home + "/.config";
}

void
ParseCommandLine(int argc, char **argv, CommandLineOptions &options,
		 ConfigData &config)
{
	bool use_config_file = true;

	// First pass: handle command line options
	OptionParser parser(option_defs, argc, argv);
	while (auto o = parser.Next()) {
		switch (Option(o.index)) {
		case OPTION_NO_CONFIG:
			use_config_file = false;
			break;

		case OPTION_STDERR:
			options.log_stderr = true;
			break;

		case OPTION_VERBOSE:
			options.verbose = true;
			break;

		case OPTION_VERSION:
			version();

		case OPTION_HELP:
		case OPTION_HELP2:
			help();
		}
	}

	/* initialize the logging library, so the configuration file
	   parser can use it already */
	log_early_init(options.verbose);

	// Second pass: find non-option parameters (i.e. config file)
	const char *config_file = nullptr;
	for (const char *i : parser.GetRemaining()) {
		if (config_file == nullptr) {
			config_file = i;
			continue;
		}

		throw std::runtime_error("too many arguments");
	}

	if (config_file != nullptr) {
		/* use specified configuration file */
		ReadConfigFile(config, config_file);
		return;
	}

	if (!use_config_file) {
		LogDebug(cmdline_domain, "Ignoring config, using defaults");
		return;
	}

	/* use default configuration file path */

	ConfigLoader loader(config);

	const auto home = GetHomeDir();
	bool found =
		loader.TryFile(GetUserConfigDir(), "vplay/vplay.conf") ||
		loader.TryFile(home, ".config/vplay/vplay.conf") ||
		loader.TryFile(home, ".vplay.conf");
	if (!found)
		LogDebug(cmdline_domain, "No configuration file found, using defaults");
}
