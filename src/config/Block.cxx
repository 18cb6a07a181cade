// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Block.hxx"
#include "Parser.hxx"
#include "lib/fmt/RuntimeError.hxx"

#include <exception>

void
BlockParam::ThrowWithNested() const
{
	std::throw_with_nested(FmtRuntimeError("Error in setting \"{}\" on line {}",
					       name, line));
}

unsigned
BlockParam::GetPositiveValue() const
{
	return With(ParsePositive);
}

bool
BlockParam::GetBoolValue() const
{
	return With(ParseBool);
}

const BlockParam *
ConfigBlock::GetBlockParam(const char *name) const noexcept
{
	for (const auto &i : block_params) {
		if (i.name == name) {
			i.used = true;
			return &i;
		}
	}

	return nullptr;
}

const char *
ConfigBlock::GetBlockValue(const char *name,
			   const char *default_value) const noexcept
{
	const auto *param = GetBlockParam(name);
	return param != nullptr
		? param->value.c_str()
		: default_value;
}

bool
ConfigBlock::GetBlockValue(const char *name, bool default_value) const
{
	const auto *param = GetBlockParam(name);
	return param != nullptr
		? param->GetBoolValue()
		: default_value;
}

unsigned
ConfigBlock::GetPositiveValue(const char *name, unsigned default_value) const
{
	const auto *param = GetBlockParam(name);
	return param != nullptr
		? param->GetPositiveValue()
		: default_value;
}
