// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef VPLAY_TIMER_HXX
#define VPLAY_TIMER_HXX

#include <chrono>
#include <cstddef>

struct AudioFormat;

/**
 * Tracks how much audio has been "played" by an output without a
 * hardware clock, so it can pace itself in real time.
 */
class Timer {
	using Clock = std::chrono::steady_clock;

	/**
	 * The point in time at which all data passed to Add() will
	 * have been played.
	 */
	Clock::time_point end;

	/**
	 * Bytes per second.
	 */
	const unsigned rate;

	bool started = false;

public:
	explicit Timer(AudioFormat af) noexcept;

	bool IsStarted() const noexcept { return started; }

	void Start() noexcept;
	void Reset() noexcept;

	/**
	 * Account for the given number of bytes.
	 */
	void Add(std::size_t size) noexcept;

	/**
	 * Returns the duration to sleep to get back to sync.
	 */
	[[gnu::pure]]
	Clock::duration GetDelay() const noexcept;
};

#endif
