// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef VPLAY_DECODER_PLUGIN_HXX
#define VPLAY_DECODER_PLUGIN_HXX

struct ConfigBlock;
class FileReader;
class DecoderClient;

struct DecoderPlugin {
	const char *name;

	/**
	 * Initialize the decoder plugin.  Optional method.
	 *
	 * Throws on error.
	 *
	 * @param block a configuration block for this plugin, or an
	 * empty block if not configured
	 * @return false if the plugin is not available
	 */
	bool (*init)(const ConfigBlock &block) = nullptr;

	/**
	 * Deinitialize a decoder plugin which was initialized
	 * successfully.  Optional method.
	 */
	void (*finish)() noexcept = nullptr;

	/**
	 * Decode a regular file.  The plugin calls
	 * DecoderClient::Ready() once the stream headers have been
	 * parsed, and DecoderClient::SubmitAudio() for every chunk
	 * of PCM data until it returns DecoderCommand::STOP.
	 *
	 * Throws on error.
	 */
	void (*file_decode)(DecoderClient &client, FileReader &file);

	/**
	 * A nullptr-terminated list of file name suffixes this plugin
	 * handles.
	 */
	const char *const*suffixes = nullptr;

	constexpr DecoderPlugin(const char *_name,
				void (*_file_decode)(DecoderClient &client,
						     FileReader &file)) noexcept
		:name(_name), file_decode(_file_decode) {}

	constexpr auto WithInit(bool (*_init)(const ConfigBlock &block),
				void (*_finish)() noexcept = nullptr) const noexcept {
		auto copy = *this;
		copy.init = _init;
		copy.finish = _finish;
		return copy;
	}

	constexpr auto WithSuffixes(const char *const*_suffixes) const noexcept {
		auto copy = *this;
		copy.suffixes = _suffixes;
		return copy;
	}

	/**
	 * Initialize a decoder plugin.
	 *
	 * Throws on error.
	 *
	 * @return true if the plugin was initialized successfully,
	 * false if the plugin is not available
	 */
	bool Init(const ConfigBlock &block) const {
		return init != nullptr
			? init(block)
			: true;
	}

	/**
	 * Deinitialize a decoder plugin which was initialized
	 * successfully.
	 */
	void Finish() const noexcept {
		if (finish != nullptr)
			finish();
	}

	/**
	 * Decode a file.
	 */
	void FileDecode(DecoderClient &client, FileReader &file) const {
		file_decode(client, file);
	}
};

#endif
