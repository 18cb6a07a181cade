// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include <concepts>
#include <string>
#include <utility>
#include <vector>

/**
 * One "name value" line inside a #ConfigBlock.
 */
struct BlockParam {
	std::string name;
	std::string value;
	int line;

	/**
	 * Set by ConfigBlock::GetBlockParam(); a line which nobody
	 * has looked up is reported by CheckUnusedOptions().
	 */
	mutable bool used = false;

	template<typename N, typename V>
	BlockParam(N &&_name, V &&_value, int _line=-1) noexcept
		:name(std::forward<N>(_name)), value(std::forward<V>(_value)),
		 line(_line) {}

	unsigned GetPositiveValue() const;

	bool GetBoolValue() const;

	/**
	 * Call this method in a "catch" block to throw a nested
	 * exception showing the location of this setting in the
	 * configuration file.
	 */
	[[noreturn]]
	void ThrowWithNested() const;

	/**
	 * Invoke a function with the configured value; if the
	 * function throws, call ThrowWithNested().
	 */
	template<std::regular_invocable<const char *> F>
	auto With(F &&f) const {
		try {
			return f(value.c_str());
		} catch (...) {
			ThrowWithNested();
		}
	}
};

/**
 * A "name { ... }" section of vplay.conf, i.e. the "audio_output"
 * block or one of the "decoder" blocks.
 */
struct ConfigBlock {
	int line;

	std::vector<BlockParam> block_params;

	/**
	 * Has the owner of this block (an output or a decoder
	 * plugin) seen it?  Only then are its unknown settings
	 * reported.
	 */
	mutable bool used = false;

	explicit ConfigBlock(int _line=-1)
		:line(_line) {}

	ConfigBlock(ConfigBlock &&) = default;
	ConfigBlock &operator=(ConfigBlock &&) = default;

	/**
	 * Was this instance synthesized (e.g. because vplay.conf has
	 * no "audio_output" block) instead of being loaded?
	 */
	bool IsNull() const noexcept {
		return line < 0;
	}

	void SetUsed() const noexcept {
		used = true;
	}

	template<typename N, typename V>
	void AddBlockParam(N &&_name, V &&_value, int _line=-1) noexcept {
		block_params.emplace_back(std::forward<N>(_name),
					  std::forward<V>(_value),
					  _line);
	}

	[[gnu::nonnull]] [[gnu::pure]]
	const BlockParam *GetBlockParam(const char *_name) const noexcept;

	[[gnu::pure]]
	const char *GetBlockValue(const char *name,
				  const char *default_value=nullptr) const noexcept;

	bool GetBlockValue(const char *name, bool default_value) const;

	unsigned GetPositiveValue(const char *name, unsigned default_value) const;
};
