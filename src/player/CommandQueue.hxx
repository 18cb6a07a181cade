// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef VPLAY_PLAYER_COMMAND_QUEUE_HXX
#define VPLAY_PLAYER_COMMAND_QUEUE_HXX

#include "Command.hxx"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>

/**
 * An unbounded multi-producer single-consumer queue of
 * #PlayerCommand instances.  Producers (#PlayerHandle) register
 * themselves with AddSender(); the queue is "closed" for the
 * consumer once the last producer is gone and all commands have
 * been received.
 */
class CommandQueue {
	std::mutex mutex;
	std::condition_variable cond;

	std::deque<PlayerCommand> queue;

	/**
	 * The number of registered producers.
	 */
	unsigned n_senders = 0;

	/**
	 * Has the consumer exited?  If yes, Push() fails.
	 */
	bool receiver_closed = false;

	/**
	 * Has WakeUp() been called since the consumer's last
	 * Wait()/WaitFor() call?
	 */
	bool woken = false;

public:
	enum class ReceiveResult {
		/**
		 * A command was moved to the destination.
		 */
		COMMAND,

		/**
		 * The timeout has expired or WakeUp() was called,
		 * and no command was received.
		 */
		EMPTY,

		/**
		 * The queue is empty and there are no producers
		 * left; no more commands will arrive.
		 */
		CLOSED,
	};

	CommandQueue() = default;
	CommandQueue(const CommandQueue &) = delete;
	CommandQueue &operator=(const CommandQueue &) = delete;

	void AddSender() noexcept;
	void RemoveSender() noexcept;

	/**
	 * Append a command to the queue and wake up the consumer.
	 *
	 * Throws #AudioError (ENGINE_UNAVAILABLE) if the consumer has
	 * exited.
	 */
	void Push(PlayerCommand &&cmd);

	/**
	 * Make the consumer's current (or next) Wait() or WaitFor()
	 * call return without a command.  Used by the decoder
	 * threads to report new audio.
	 */
	void WakeUp() noexcept;

	/**
	 * Wait until a command arrives or the queue is closed.
	 */
	ReceiveResult Wait(PlayerCommand &dest) noexcept;

	/**
	 * Like Wait(), but give up after the specified duration.  A
	 * zero duration polls without blocking.
	 */
	ReceiveResult WaitFor(PlayerCommand &dest,
			      std::chrono::steady_clock::duration timeout) noexcept;

	/**
	 * Called by the consumer when it exits.  Pending commands are
	 * discarded (abandoning their promises), and all further
	 * Push() calls fail.
	 */
	void CloseReceiver() noexcept;

private:
	ReceiveResult Pop(PlayerCommand &dest) noexcept;
};

#endif
