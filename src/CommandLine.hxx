// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef VPLAY_COMMAND_LINE_HXX
#define VPLAY_COMMAND_LINE_HXX

struct ConfigData;

struct CommandLineOptions {
	bool log_stderr = false;
	bool verbose = false;
};

/**
 * Parse the command line and load the configuration file.  Exits
 * the process after --help and --version.
 *
 * Throws on error.
 */
void
ParseCommandLine(int argc, char **argv, CommandLineOptions &options,
		 ConfigData &config);

#endif
