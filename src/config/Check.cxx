// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Check.hxx"
#include "Data.hxx"
#include "util/Domain.hxx"
#include "Log.hxx"

static constexpr Domain config_domain("config");

static void
CheckUnusedOptions(const ConfigBlock &block) noexcept
{
	if (!block.used)
		/* a decoder block of a plugin which is not
		   compiled in; nobody could have looked at it */
		return;

	for (const auto &i : block.block_params)
		if (!i.used)
			FmtWarning(config_domain,
				   "option '{}' on line {} was not recognized",
				   i.name, i.line);
}

void
CheckUnusedOptions(const ConfigData &config_data) noexcept
{
	for (const auto &list : config_data.blocks)
		for (const auto &block : list)
			CheckUnusedOptions(block);
}
