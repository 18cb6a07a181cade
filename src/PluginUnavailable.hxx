// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef VPLAY_PLUGIN_UNAVAILABLE_HXX
#define VPLAY_PLUGIN_UNAVAILABLE_HXX

#include <stdexcept>

/**
 * An exception class which is used by plugin initializers to
 * indicate that this plugin is unavailable.  It will be disabled,
 * and vplay can continue initialization.
 */
class PluginUnavailable : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

#endif
