// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Templates.hxx"
#include "Option.hxx"

#include <algorithm>
#include <iterator>
#include <string_view>

/* indexed by ConfigOption */
static constexpr ConfigTemplate config_param_templates[] = {
	{ "log_file" },
	{ "log_level" },
	{ "play_timeout" },
};

static_assert(std::size(config_param_templates) == std::size_t(ConfigOption::MAX),
	      "Wrong number of config_param_templates");

/* there may be one "decoder" block per plugin */
const ConfigTemplate config_block_templates[] = {
	{ "audio_output" },
	{ "decoder", true },
};

static_assert(std::size(config_block_templates) == std::size_t(ConfigBlockOption::MAX),
	      "Wrong number of config_block_templates");

/**
 * @return the index of the template or the size of the array if
 * there is none with this name
 */
template<std::size_t N>
[[gnu::pure]]
static std::size_t
FindTemplate(const ConfigTemplate (&templates)[N],
	     std::string_view name) noexcept
{
	const auto i = std::find_if(std::begin(templates), std::end(templates),
				    [name](const ConfigTemplate &t){
					    return name == t.name;
				    });
	return std::distance(std::begin(templates), i);
}

ConfigOption
ParseConfigOptionName(const char *name) noexcept
{
	return ConfigOption(FindTemplate(config_param_templates, name));
}

ConfigBlockOption
ParseConfigBlockOptionName(const char *name) noexcept
{
	return ConfigBlockOption(FindTemplate(config_block_templates, name));
}
