// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef VPLAY_PLAYER_ENGINE_HXX
#define VPLAY_PLAYER_ENGINE_HXX

#include "FormatDispatcher.hxx"
#include "thread/Thread.hxx"

#include <chrono>
#include <condition_variable>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>

class AudioOutput;
class CommandQueue;
class PlayerHandle;

/**
 * Owns the player thread.  The #AudioOutput is created, used and
 * destroyed inside that thread; callers only get #PlayerHandle
 * instances.
 */
class AudioEngine {
public:
	/**
	 * Creates the #AudioOutput; called once, inside the player
	 * thread.  Throws on error.
	 */
	using OutputFactory = std::function<std::unique_ptr<AudioOutput>()>;

private:
	const OutputFactory output_factory;

	const FormatDispatcher dispatcher;

	const std::shared_ptr<CommandQueue> queue;

	const std::chrono::steady_clock::duration timeout;

	Thread thread;

	/**
	 * Protects #startup_finished and #startup_error.
	 */
	std::mutex mutex;

	/**
	 * Signalled by the player thread after the output has been
	 * enabled (or has failed).
	 */
	std::condition_variable cond;

	bool startup_finished = false;

	/**
	 * The error which occurred while the player thread was
	 * creating the output.
	 */
	std::exception_ptr startup_error;

public:
	/**
	 * @param _timeout how long #PlayerHandle methods wait for the
	 * player thread
	 */
	AudioEngine(OutputFactory _output_factory,
		    FormatDispatcher _dispatcher,
		    std::chrono::steady_clock::duration _timeout) noexcept;

	~AudioEngine() noexcept;

	AudioEngine(const AudioEngine &) = delete;
	AudioEngine &operator=(const AudioEngine &) = delete;

	/**
	 * Start the player thread and wait until the output has been
	 * enabled.  May only be called once.
	 *
	 * Throws if the output could not be created; in that case, the
	 * thread has already exited.
	 *
	 * @return the first handle; the thread exits after the last
	 * copy has been destroyed
	 */
	PlayerHandle Start();

	/**
	 * Wait for the player thread to exit.  All #PlayerHandle
	 * instances must have been destroyed before.
	 */
	void Join() noexcept;

private:
	void RunThread() noexcept;

	void SignalStartup(std::exception_ptr error) noexcept;
};

#endif
