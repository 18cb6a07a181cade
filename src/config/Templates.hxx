// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef VPLAY_CONFIG_TEMPLATES_HXX
#define VPLAY_CONFIG_TEMPLATES_HXX

/**
 * Describes one setting or block name known to vplay.conf.
 */
struct ConfigTemplate {
	const char *const name;

	/**
	 * May this block occur more than once?  Top-level settings
	 * are never repeatable; the last occurrence wins.
	 */
	const bool repeatable;

	constexpr ConfigTemplate(const char *_name,
				 bool _repeatable=false) noexcept
		:name(_name), repeatable(_repeatable) {}
};

/**
 * Indexed by #ConfigBlockOption.
 */
extern const ConfigTemplate config_block_templates[];

#endif
