// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Data.hxx"
#include "Parser.hxx"
#include "lib/fmt/RuntimeError.hxx"

#include <string.h>

std::chrono::steady_clock::duration
ConfigData::GetDuration(ConfigOption option,
			std::chrono::steady_clock::duration min_value,
			std::chrono::steady_clock::duration default_value) const
{
	return With(option, [min_value, default_value](const char *s){
		if (s == nullptr)
			return default_value;

		const auto value = ParseDuration(s);
		if (value < min_value)
			throw std::runtime_error{"Value is too small"};

		return value;
	});
}

const ConfigBlock *
ConfigData::FindBlock(ConfigBlockOption option,
		      const char *key, const char *value) const
{
	for (const auto &block : GetBlockList(option)) {
		const char *value2 = block.GetBlockValue(key);
		if (value2 == nullptr)
			throw FmtRuntimeError("block without \"{}\" in line {}",
					      key, block.line);

		if (strcmp(value2, value) == 0)
			return &block;
	}

	return nullptr;
}
