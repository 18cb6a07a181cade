// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "FormatDispatcher.hxx"
#include "Error.hxx"
#include "decoder/DecoderPlugin.hxx"
#include "decoder/DecoderList.hxx"
#include "io/FileReader.hxx"
#include "system/Error.hxx"
#include "util/CharUtil.hxx"

#include <fmt/core.h>

#include <algorithm>
#include <string>

namespace {

struct DecoderRoute {
	/**
	 * The lower-case file name suffix; nullptr matches every
	 * suffix.
	 */
	const char *suffix;

	const char *plugin;

	/**
	 * Prepended to decoder error messages.
	 */
	const char *prefix;
};

}

static constexpr DecoderRoute decoder_routes[] = {
	{ "mp3", "mpg123", "MP3: " },
	{ "wav", "sndfile", "WAV: " },
	{ "flac", "flac", "FLAC: " },
	{ "ogg", "vorbis", "Vorbis: " },

	/* the fallback sniffs the container format */
	{ nullptr, "ffmpeg", "Decode: " },
};

/**
 * Suffixes which are rejected without opening the file.
 */
static constexpr const char *rejected_suffixes[] = {
	"m4a",
	"aac",
};

/**
 * Returns the lower-case text after the last dot of the last path
 * component, or an empty string.
 */
static std::string
GetLowerSuffix(std::string_view path) noexcept
{
	const auto slash = path.rfind('/');
	if (slash != path.npos)
		path = path.substr(slash + 1);

	const auto dot = path.rfind('.');
	if (dot == path.npos)
		return {};

	std::string suffix{path.substr(dot + 1)};
	std::transform(suffix.begin(), suffix.end(), suffix.begin(),
		       ToLowerASCII);
	return suffix;
}

[[gnu::pure]]
static const DecoderRoute &
FindRoute(std::string_view suffix) noexcept
{
	for (const auto &route : decoder_routes)
		if (route.suffix == nullptr || suffix == route.suffix)
			return route;

	/* unreachable: the last route matches everything */
	return decoder_routes[std::size(decoder_routes) - 1];
}

FormatDispatcher
FormatDispatcher::FromDecoderList() noexcept
{
	std::vector<const DecoderPlugin *> list;
	decoder_plugins_for_each_enabled([&list](const DecoderPlugin &plugin){
		list.push_back(&plugin);
	});

	return FormatDispatcher{std::move(list)};
}

const DecoderPlugin *
FormatDispatcher::FindPlugin(std::string_view name) const noexcept
{
	for (const auto *plugin : plugins)
		if (name == plugin->name)
			return plugin;

	return nullptr;
}

/**
 * Open the file, translating errors to #AudioError.
 */
static FileReader
OpenSourceFile(const char *path)
{
	try {
		return FileReader{path};
	} catch (const std::system_error &e) {
		if (IsFileNotFound(e))
			throw AudioError::NotFound();

		throw AudioError{AudioErrorCode::IO, e.code().message()};
	}
}

std::unique_ptr<Source>
FormatDispatcher::Decode(const char *path, SourceListener &listener) const
{
	const auto suffix = GetLowerSuffix(path);

	if (std::find(std::begin(rejected_suffixes),
		      std::end(rejected_suffixes),
		      suffix) != std::end(rejected_suffixes))
		throw AudioError::UnsupportedFormat();

	auto file = OpenSourceFile(path);

	const auto &route = FindRoute(suffix);
	const auto *plugin = FindPlugin(route.plugin);
	if (plugin == nullptr)
		throw AudioError{AudioErrorCode::DECODE,
				 fmt::format("{}decoder plugin '{}' is not available",
					     route.prefix, route.plugin)};

	auto source = std::make_unique<Source>(path, *plugin, route.prefix,
					       std::move(file), listener);
	source->Start();
	return source;
}
