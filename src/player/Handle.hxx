// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef VPLAY_PLAYER_HANDLE_HXX
#define VPLAY_PLAYER_HANDLE_HXX

#include <chrono>
#include <memory>
#include <string>
#include <utility>

class CommandQueue;
struct PlayerStatus;

/**
 * The caller side of the player thread.  It only holds the sending
 * end of the command queue; each copy is one producer, and the
 * player thread exits after the last copy has been destroyed.
 *
 * All methods throw #AudioError.
 */
class PlayerHandle {
	std::shared_ptr<CommandQueue> queue;

	/**
	 * How long do Play() and GetStatus() wait for the player
	 * thread?
	 */
	std::chrono::steady_clock::duration timeout;

public:
	PlayerHandle(std::shared_ptr<CommandQueue> _queue,
		     std::chrono::steady_clock::duration _timeout) noexcept;

	PlayerHandle(const PlayerHandle &src) noexcept;

	PlayerHandle(PlayerHandle &&src) noexcept = default;

	~PlayerHandle() noexcept;

	PlayerHandle &operator=(PlayerHandle src) noexcept {
		std::swap(queue, src.queue);
		std::swap(timeout, src.timeout);
		return *this;
	}

	/**
	 * Replace the sink contents with the given file and wait for
	 * the outcome.  Returns after the stream headers and the
	 * first chunk have been decoded; the rest is decoded during
	 * playback.
	 */
	void Play(std::string path);

	/**
	 * Stop playback.  Does not wait.
	 */
	void Stop();

	/**
	 * Toggle the pause flag.  Does not wait.
	 */
	void PauseOrResume();

	/**
	 * Ask the player thread for a #PlayerStatus snapshot.
	 */
	PlayerStatus GetStatus();
};

#endif
