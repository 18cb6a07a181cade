// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef VPLAY_PLAYER_SINK_HXX
#define VPLAY_PLAYER_SINK_HXX

#include "Source.hxx"
#include "Status.hxx"

#include <cstddef>
#include <deque>
#include <memory>
#include <span>

/**
 * The queue of sources waiting to be played.  It is owned by the
 * player thread and is not thread-safe.
 */
class Sink {
	std::deque<std::unique_ptr<Source>> sources;

	bool paused = false;

public:
	/**
	 * Append a source.  Sources without audio are ignored.
	 */
	void Append(std::unique_ptr<Source> source) noexcept;

	bool IsEmpty() const noexcept {
		return sources.empty();
	}

	bool IsPaused() const noexcept {
		return paused;
	}

	/**
	 * Is there audio to be written to the output?
	 */
	bool IsPlaying() const noexcept {
		return !paused && !sources.empty();
	}

	/**
	 * Can Read() make progress right now?  If not, the decoder
	 * of the current source has not caught up yet.
	 */
	[[gnu::pure]]
	bool IsReadable() const noexcept {
		return !sources.empty() && sources.front()->IsReadable();
	}

	PlayerState GetState() const noexcept {
		if (sources.empty())
			return PlayerState::STOP;

		return paused ? PlayerState::PAUSE : PlayerState::PLAY;
	}

	/**
	 * Returns the source being played or nullptr if the sink is
	 * empty.
	 */
	const Source *GetCurrent() const noexcept {
		return sources.empty() ? nullptr : sources.front().get();
	}

	/**
	 * Returns up to #max_bytes of the current source which have
	 * not been consumed yet.  Sources which have been played
	 * completely are removed first.  The span is empty if the
	 * sink is empty or if the decoder has not caught up.
	 */
	std::span<const float> Read(std::size_t max_bytes) noexcept;

	/**
	 * Mark samples returned by Read() as played.
	 */
	void Consume(std::size_t n_samples) noexcept;

	/**
	 * Discard all sources, stopping their decoders.  The pause
	 * flag is kept.
	 */
	void Clear() noexcept;

	/**
	 * Discard all sources and reset the pause flag.
	 */
	void Stop() noexcept {
		Clear();
		paused = false;
	}

	/**
	 * @return the new value of the pause flag
	 */
	bool TogglePause() noexcept {
		paused = !paused;
		return paused;
	}

	PlayerStatus GetStatus() const noexcept;
};

#endif
