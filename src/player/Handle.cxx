// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Handle.hxx"
#include "CommandQueue.hxx"
#include "Error.hxx"

#include <cassert>

PlayerHandle::PlayerHandle(std::shared_ptr<CommandQueue> _queue,
			   std::chrono::steady_clock::duration _timeout) noexcept
	:queue(std::move(_queue)), timeout(_timeout)
{
	assert(queue != nullptr);

	queue->AddSender();
}

PlayerHandle::PlayerHandle(const PlayerHandle &src) noexcept
	:queue(src.queue), timeout(src.timeout)
{
	if (queue != nullptr)
		queue->AddSender();
}

PlayerHandle::~PlayerHandle() noexcept
{
	if (queue != nullptr)
		queue->RemoveSender();
}

/**
 * Wait for the reply of the player thread, but not longer than the
 * given timeout.
 */
template<typename T>
static T
WaitReply(Future<T> &future, std::chrono::steady_clock::duration timeout)
{
	if (future.wait_for(timeout) != std::future_status::ready)
		throw AudioError::Timeout();

	try {
		return future.get();
	} catch (const std::future_error &) {
		/* the promise was abandoned: the player thread has
		   exited before handling the command */
		throw AudioError::EngineUnavailable();
	}
}

void
PlayerHandle::Play(std::string path)
{
	if (queue == nullptr)
		throw AudioError::EngineUnavailable();

	Promise<void> promise;
	auto future = promise.get_future();

	queue->Push(PlayCommand{std::move(path), std::move(promise)});

	WaitReply(future, timeout);
}

void
PlayerHandle::Stop()
{
	if (queue == nullptr)
		throw AudioError::EngineUnavailable();

	queue->Push(StopCommand{});
}

void
PlayerHandle::PauseOrResume()
{
	if (queue == nullptr)
		throw AudioError::EngineUnavailable();

	queue->Push(PauseCommand{});
}

PlayerStatus
PlayerHandle::GetStatus()
{
	if (queue == nullptr)
		throw AudioError::EngineUnavailable();

	Promise<PlayerStatus> promise;
	auto future = promise.get_future();

	queue->Push(StatusCommand{std::move(promise)});

	return WaitReply(future, timeout);
}
