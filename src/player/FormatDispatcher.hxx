// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef VPLAY_PLAYER_FORMAT_DISPATCHER_HXX
#define VPLAY_PLAYER_FORMAT_DISPATCHER_HXX

#include "Source.hxx"

#include <memory>
#include <string_view>
#include <vector>

struct DecoderPlugin;

/**
 * Chooses a #DecoderPlugin by file name suffix and starts it on a
 * #Source.
 */
class FormatDispatcher {
	std::vector<const DecoderPlugin *> plugins;

public:
	/**
	 * @param _plugins the plugins which may be used; each route
	 * looks up its plugin by name in this list
	 */
	explicit FormatDispatcher(std::vector<const DecoderPlugin *> _plugins) noexcept
		:plugins(std::move(_plugins)) {}

	/**
	 * Construct an instance with all enabled plugins from
	 * #decoder_plugins.
	 */
	static FormatDispatcher FromDecoderList() noexcept;

	/**
	 * Open the specified file and start decoding it.  Returns
	 * after the stream headers have been parsed and the first
	 * chunk has been decoded; the rest is decoded while the
	 * #Source is being played.
	 *
	 * Throws #AudioError on error.
	 *
	 * @param listener notified by the decoder thread
	 */
	std::unique_ptr<Source> Decode(const char *path,
				       SourceListener &listener) const;

private:
	[[gnu::pure]]
	const DecoderPlugin *FindPlugin(std::string_view name) const noexcept;
};

#endif
