// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef VPLAY_DECODER_LIST_HXX
#define VPLAY_DECODER_LIST_HXX

struct ConfigData;
struct DecoderPlugin;

extern const struct DecoderPlugin *const decoder_plugins[];
extern bool decoder_plugins_enabled[];

/**
 * Initialize all compiled-in plugins, except those which are
 * disabled by a "decoder" block.
 *
 * Throws on error.
 */
void
decoder_plugin_init_all(const ConfigData &config);

void
decoder_plugin_deinit_all() noexcept;

class ScopeDecoderPluginsInit {
public:
	explicit ScopeDecoderPluginsInit(const ConfigData &config) {
		decoder_plugin_init_all(config);
	}

	~ScopeDecoderPluginsInit() noexcept {
		decoder_plugin_deinit_all();
	}

	ScopeDecoderPluginsInit(const ScopeDecoderPluginsInit &) = delete;
	ScopeDecoderPluginsInit &operator=(const ScopeDecoderPluginsInit &) = delete;
};

template<typename F>
static inline void
decoder_plugins_for_each_enabled(F f)
{
	for (unsigned i = 0; decoder_plugins[i] != nullptr; ++i)
		if (decoder_plugins_enabled[i])
			f(*decoder_plugins[i]);
}

#endif
