// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Engine.hxx"
#include "CommandQueue.hxx"
#include "Handle.hxx"
#include "output/Interface.hxx"

AudioEngine::AudioEngine(OutputFactory _output_factory,
			 FormatDispatcher _dispatcher,
			 std::chrono::steady_clock::duration _timeout) noexcept
	:output_factory(std::move(_output_factory)),
	 dispatcher(std::move(_dispatcher)),
	 queue(std::make_shared<CommandQueue>()),
	 timeout(_timeout),
	 thread("player", [this]{ RunThread(); })
{
}

AudioEngine::~AudioEngine() noexcept
{
	Join();
}

PlayerHandle
AudioEngine::Start()
{
	/* register the first sender before the thread starts, or
	   it would see an empty queue without senders and exit
	   right away */
	PlayerHandle handle{queue, timeout};

	thread.Start();

	std::exception_ptr error;

	{
		std::unique_lock<std::mutex> lock(mutex);
		cond.wait(lock, [this]{ return startup_finished; });
		error = startup_error;
	}

	if (error) {
		thread.Join();
		std::rethrow_exception(error);
	}

	return handle;
}

void
AudioEngine::Join() noexcept
{
	if (thread.IsDefined())
		thread.Join();
}

void
AudioEngine::SignalStartup(std::exception_ptr error) noexcept
{
	const std::scoped_lock<std::mutex> lock(mutex);
	startup_finished = true;
	startup_error = std::move(error);
	cond.notify_one();
}
