// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef VPLAY_LOG_INIT_HXX
#define VPLAY_LOG_INIT_HXX

struct ConfigData;

/**
 * Configure logging before the configuration file is read.
 *
 * @param verbose true when the program is started with --verbose
 */
void
log_early_init(bool verbose) noexcept;

/**
 * Apply the "log_level" and "log_file" settings.
 *
 * Throws #std::runtime_error on error.
 *
 * @param use_stderr ignore "log_file" and keep logging to stderr
 */
void
log_init(const ConfigData &config, bool verbose, bool use_stderr);

void
log_deinit() noexcept;

#endif
