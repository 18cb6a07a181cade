// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "File.hxx"
#include "Data.hxx"
#include "Param.hxx"
#include "Block.hxx"
#include "Templates.hxx"
#include "Path.hxx"
#include "io/FileReader.hxx"
#include "io/BufferedReader.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "util/Domain.hxx"
#include "util/StringStrip.hxx"
#include "util/Tokenizer.hxx"
#include "Log.hxx"

#include <cassert>
#include <string>

#include <string.h>

static constexpr char CONF_COMMENT = '#';

static constexpr Domain config_file_domain("config_file");

/**
 * Read a string value as the last token of a line.  Throws on error.
 */
static auto
ExpectValueAndEnd(Tokenizer &tokenizer)
{
	auto value = tokenizer.NextString();
	if (!value)
		throw std::runtime_error("Value missing");

	if (!tokenizer.IsEnd() && tokenizer.CurrentChar() != CONF_COMMENT)
		throw std::runtime_error("Unknown tokens after value");

	return value;
}

static void
config_read_name_value(ConfigBlock &block, char *input, unsigned line)
{
	Tokenizer tokenizer(input);

	const char *name = tokenizer.NextWord();
	assert(name != nullptr);

	auto value = ExpectValueAndEnd(tokenizer);

	const BlockParam *bp = block.GetBlockParam(name);
	if (bp != nullptr)
		throw FmtRuntimeError("\"{}\" is duplicate, first defined on line {}",
				      name, bp->line);

	block.AddBlockParam(name, value, line);
}

static ConfigBlock
config_read_block(BufferedReader &reader)
{
	ConfigBlock block(reader.GetLineNumber());

	while (true) {
		char *line = reader.ReadLine();
		if (line == nullptr)
			throw std::runtime_error("Expected '}' before end-of-file");

		line = StripLeft(line);
		if (*line == 0 || *line == CONF_COMMENT)
			continue;

		if (*line == '}') {
			line = StripLeft(line + 1);
			if (*line != 0 && *line != CONF_COMMENT)
				throw std::runtime_error("Unknown tokens after '}'");

			return block;
		}

		config_read_name_value(block, line,
				       reader.GetLineNumber());
	}
}

static void
ReadConfigBlock(ConfigData &config_data, BufferedReader &reader,
		const char *name, ConfigBlockOption o,
		Tokenizer &tokenizer)
{
	const ConfigTemplate &option = config_block_templates[unsigned(o)];

	if (!option.repeatable)
		if (const auto *block = config_data.GetBlock(o))
			throw FmtRuntimeError("config parameter \"{}\" is first defined "
					      "on line {} and redefined on line {}",
					      name, block->line,
					      reader.GetLineNumber());

	if (tokenizer.CurrentChar() != '{')
		throw std::runtime_error("'{' expected");

	char *line = StripLeft(tokenizer.Rest() + 1);
	if (*line != 0 && *line != CONF_COMMENT)
		throw std::runtime_error("Unknown tokens after '{'");

	config_data.AddBlock(o, config_read_block(reader));
}

static void
ReadConfigParam(ConfigData &config_data, BufferedReader &reader,
		ConfigOption o, Tokenizer &tokenizer)
{
	/* a later occurrence (e.g. in an included file) overrides
	   the earlier one */
	config_data.SetParam(o, ConfigParam(ExpectValueAndEnd(tokenizer),
					    reader.GetLineNumber()));
}

/**
 * Resolve an "include" argument relative to the directory of the
 * including file.
 */
static std::string
ApplyDirectory(const char *directory, const char *path)
{
	if (*path == '~' || *path == '$')
		return ParsePath(path);

	if (*path == '/')
		return std::string{path};

	std::string result{directory};
	if (!result.empty())
		result.push_back('/');
	result.append(path);
	return result;
}

static std::string
GetDirectoryName(const char *path) noexcept
{
	const char *slash = strrchr(path, '/');
	if (slash == nullptr)
		return ".";

	if (slash == path)
		return "/";

	return {path, slash};
}

static void
ReadConfigFile(ConfigData &config_data, BufferedReader &reader,
	       const char *directory)
{
	while (true) {
		char *line = reader.ReadLine();
		if (line == nullptr)
			return;

		line = StripLeft(line);
		if (*line == 0 || *line == CONF_COMMENT)
			continue;

		/* the first token in each line is the name, followed
		   by either the value or '{' */

		Tokenizer tokenizer(line);
		const char *name = tokenizer.NextWord();
		assert(name != nullptr);

		if (strcmp(name, "include") == 0) {
			const auto path =
				ApplyDirectory(directory,
					       ExpectValueAndEnd(tokenizer));
			ReadConfigFile(config_data, path.c_str());
			continue;
		}

		const ConfigOption o = ParseConfigOptionName(name);
		ConfigBlockOption bo;
		if (o != ConfigOption::MAX) {
			ReadConfigParam(config_data, reader, o, tokenizer);
		} else if ((bo = ParseConfigBlockOptionName(name)) != ConfigBlockOption::MAX) {
			ReadConfigBlock(config_data, reader, name, bo,
					tokenizer);
		} else {
			throw FmtRuntimeError("unrecognized parameter: {}",
					      name);
		}
	}
}

void
ReadConfigFile(ConfigData &config_data, const char *path)
{
	assert(path != nullptr);

	FmtDebug(config_file_domain, "loading file {}", path);

	FileReader file(path);
	BufferedReader reader(file);

	try {
		ReadConfigFile(config_data, reader,
			       GetDirectoryName(path).c_str());
	} catch (...) {
		std::throw_with_nested(FmtRuntimeError("Error in line {} of \"{}\"",
						       reader.GetLineNumber(),
						       path));
	}
}
