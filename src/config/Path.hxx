// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include <string>
#include <string_view>

/**
 * Determine the current user's home directory from $HOME or the
 * password database.  Returns an empty string if unknown.
 */
[[gnu::pure]]
std::string
GetHomeDir() noexcept;

/**
 * Parse a path from the configuration file.  A "~" prefix is expanded
 * to a home directory, and a "$HOME" or "$XDG_CONFIG_HOME" prefix to
 * the variable's value.  Other relative paths are rejected.
 *
 * Throws #std::runtime_error on error.
 */
std::string
ParsePath(std::string_view path);
