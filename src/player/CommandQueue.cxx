// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "CommandQueue.hxx"
#include "Error.hxx"

#include <cassert>

void
CommandQueue::AddSender() noexcept
{
	const std::scoped_lock<std::mutex> lock(mutex);
	++n_senders;
}

void
CommandQueue::RemoveSender() noexcept
{
	const std::scoped_lock<std::mutex> lock(mutex);
	assert(n_senders > 0);

	if (--n_senders == 0)
		cond.notify_one();
}

void
CommandQueue::Push(PlayerCommand &&cmd)
{
	const std::scoped_lock<std::mutex> lock(mutex);

	if (receiver_closed)
		throw AudioError::EngineUnavailable();

	queue.emplace_back(std::move(cmd));
	cond.notify_one();
}

void
CommandQueue::WakeUp() noexcept
{
	const std::scoped_lock<std::mutex> lock(mutex);
	woken = true;
	cond.notify_one();
}

inline CommandQueue::ReceiveResult
CommandQueue::Pop(PlayerCommand &dest) noexcept
{
	woken = false;

	if (!queue.empty()) {
		dest = std::move(queue.front());
		queue.pop_front();
		return ReceiveResult::COMMAND;
	}

	return n_senders == 0
		? ReceiveResult::CLOSED
		: ReceiveResult::EMPTY;
}

CommandQueue::ReceiveResult
CommandQueue::Wait(PlayerCommand &dest) noexcept
{
	std::unique_lock<std::mutex> lock(mutex);
	cond.wait(lock, [this]{
		return !queue.empty() || n_senders == 0 || woken;
	});
	return Pop(dest);
}

CommandQueue::ReceiveResult
CommandQueue::WaitFor(PlayerCommand &dest,
		      std::chrono::steady_clock::duration timeout) noexcept
{
	std::unique_lock<std::mutex> lock(mutex);
	if (timeout > timeout.zero())
		cond.wait_for(lock, timeout, [this]{
			return !queue.empty() || n_senders == 0 || woken;
		});
	return Pop(dest);
}

void
CommandQueue::CloseReceiver() noexcept
{
	std::deque<PlayerCommand> pending;

	{
		const std::scoped_lock<std::mutex> lock(mutex);
		receiver_closed = true;
		pending.swap(queue);
	}

	/* the pending commands are destroyed outside of the lock;
	   this breaks their promises */
}
