// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef VPLAY_CONFIG_DATA_HXX
#define VPLAY_CONFIG_DATA_HXX

#include "Option.hxx"
#include "Param.hxx"
#include "Block.hxx"

#include <array>
#include <chrono>
#include <deque>
#include <optional>

/**
 * All settings loaded from vplay.conf and its includes.  Top-level
 * settings are stored as #ConfigParam, sections as #ConfigBlock.
 */
struct ConfigData {
	std::array<std::optional<ConfigParam>, std::size_t(ConfigOption::MAX)> params;

	/**
	 * A std::deque keeps references valid while blocks are
	 * being added.
	 */
	std::array<std::deque<ConfigBlock>, std::size_t(ConfigBlockOption::MAX)> blocks;

	/**
	 * Store a setting, replacing an earlier occurrence.
	 */
	void SetParam(ConfigOption option, ConfigParam &&param) noexcept {
		params[std::size_t(option)] = std::move(param);
	}

	[[gnu::pure]]
	const ConfigParam *GetParam(ConfigOption option) const noexcept {
		const auto &param = params[std::size_t(option)];
		return param ? &*param : nullptr;
	}

	/**
	 * Invoke a function with the value of the setting, or with
	 * nullptr if it is not set.  Exceptions thrown by the
	 * function are annotated with the line number.
	 */
	template<typename F>
	auto With(ConfigOption option, F &&f) const {
		const auto *param = GetParam(option);
		return param != nullptr
			? param->With(std::forward<F>(f))
			: f(nullptr);
	}

	std::chrono::steady_clock::duration
	GetDuration(ConfigOption option,
		    std::chrono::steady_clock::duration min_value,
		    std::chrono::steady_clock::duration default_value) const;

	const auto &GetBlockList(ConfigBlockOption option) const noexcept {
		return blocks[std::size_t(option)];
	}

	ConfigBlock &AddBlock(ConfigBlockOption option,
			      ConfigBlock &&block) noexcept {
		return blocks[std::size_t(option)].emplace_back(std::move(block));
	}

	[[gnu::pure]]
	const ConfigBlock *GetBlock(ConfigBlockOption option) const noexcept {
		const auto &list = GetBlockList(option);
		return list.empty() ? nullptr : &list.front();
	}

	/**
	 * Find a block with a matching attribute.
	 *
	 * Throws if a block doesn't have the specified (mandatory) key.
	 *
	 * @param option the blocks to search
	 * @param key the attribute name
	 * @param value the expected attribute value
	 */
	[[gnu::pure]]
	const ConfigBlock *FindBlock(ConfigBlockOption option,
				     const char *key, const char *value) const;
};

#endif
