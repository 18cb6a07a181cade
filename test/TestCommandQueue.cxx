// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "player/CommandQueue.hxx"
#include "player/Handle.hxx"
#include "player/Error.hxx"

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <thread>

using std::chrono_literals::operator""ms;
using std::chrono_literals::operator""s;

TEST(CommandQueue, ClosedWithoutSenders)
{
	CommandQueue queue;
	PlayerCommand cmd;
	EXPECT_EQ(queue.WaitFor(cmd, {}), CommandQueue::ReceiveResult::CLOSED);
	EXPECT_EQ(queue.Wait(cmd), CommandQueue::ReceiveResult::CLOSED);
}

TEST(CommandQueue, EmptyWhileSenderExists)
{
	CommandQueue queue;
	queue.AddSender();

	PlayerCommand cmd;
	EXPECT_EQ(queue.WaitFor(cmd, {}), CommandQueue::ReceiveResult::EMPTY);
	EXPECT_EQ(queue.WaitFor(cmd, 10ms), CommandQueue::ReceiveResult::EMPTY);

	queue.RemoveSender();
	EXPECT_EQ(queue.WaitFor(cmd, {}), CommandQueue::ReceiveResult::CLOSED);
}

TEST(CommandQueue, Order)
{
	CommandQueue queue;
	queue.AddSender();

	queue.Push(StopCommand{});
	queue.Push(PauseCommand{});
	queue.Push(PlayCommand{"/tmp/a.mp3", std::nullopt});

	/* the last sender leaves, but pending commands are still
	   delivered */
	queue.RemoveSender();

	PlayerCommand cmd;
	ASSERT_EQ(queue.Wait(cmd), CommandQueue::ReceiveResult::COMMAND);
	EXPECT_TRUE(std::holds_alternative<StopCommand>(cmd));

	ASSERT_EQ(queue.Wait(cmd), CommandQueue::ReceiveResult::COMMAND);
	EXPECT_TRUE(std::holds_alternative<PauseCommand>(cmd));

	ASSERT_EQ(queue.Wait(cmd), CommandQueue::ReceiveResult::COMMAND);
	ASSERT_TRUE(std::holds_alternative<PlayCommand>(cmd));
	EXPECT_EQ(std::get<PlayCommand>(cmd).path, "/tmp/a.mp3");

	EXPECT_EQ(queue.Wait(cmd), CommandQueue::ReceiveResult::CLOSED);
}

TEST(CommandQueue, WakeUpByCommand)
{
	CommandQueue queue;
	queue.AddSender();

	std::thread producer([&queue]{
		std::this_thread::sleep_for(20ms);
		queue.Push(StopCommand{});
		queue.RemoveSender();
	});

	PlayerCommand cmd;
	EXPECT_EQ(queue.Wait(cmd), CommandQueue::ReceiveResult::COMMAND);
	EXPECT_EQ(queue.Wait(cmd), CommandQueue::ReceiveResult::CLOSED);

	producer.join();
}

TEST(CommandQueue, WakeUpWithoutCommand)
{
	CommandQueue queue;
	queue.AddSender();

	/* a wakeup before Wait() is not lost */
	queue.WakeUp();

	PlayerCommand cmd;
	EXPECT_EQ(queue.Wait(cmd), CommandQueue::ReceiveResult::EMPTY);

	std::thread decoder([&queue]{
		std::this_thread::sleep_for(20ms);
		queue.WakeUp();
	});

	const auto start = std::chrono::steady_clock::now();
	EXPECT_EQ(queue.WaitFor(cmd, 10s), CommandQueue::ReceiveResult::EMPTY);
	EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);

	decoder.join();

	/* pending commands have priority */
	queue.WakeUp();
	queue.Push(StopCommand{});
	EXPECT_EQ(queue.Wait(cmd), CommandQueue::ReceiveResult::COMMAND);

	/* the flag was consumed together with the command */
	EXPECT_EQ(queue.WaitFor(cmd, 10ms), CommandQueue::ReceiveResult::EMPTY);

	queue.RemoveSender();
	EXPECT_EQ(queue.Wait(cmd), CommandQueue::ReceiveResult::CLOSED);
}

TEST(CommandQueue, PushAfterClose)
{
	CommandQueue queue;
	queue.AddSender();
	queue.CloseReceiver();

	try {
		queue.Push(StopCommand{});
		FAIL() << "Push() did not throw";
	} catch (const AudioError &e) {
		EXPECT_EQ(e.GetCode(), AudioErrorCode::ENGINE_UNAVAILABLE);
	}

	queue.RemoveSender();
}

TEST(CommandQueue, CloseBreaksPromises)
{
	CommandQueue queue;
	queue.AddSender();

	Promise<PlayerStatus> promise;
	auto future = promise.get_future();
	queue.Push(StatusCommand{std::move(promise)});

	queue.CloseReceiver();
	queue.RemoveSender();

	EXPECT_THROW(future.get(), std::future_error);
}

TEST(PlayerHandle, SenderCount)
{
	auto queue = std::make_shared<CommandQueue>();
	PlayerCommand cmd;

	{
		PlayerHandle a{queue, 1s};
		EXPECT_EQ(queue->WaitFor(cmd, {}), CommandQueue::ReceiveResult::EMPTY);

		{
			PlayerHandle b = a;
			PlayerHandle c = std::move(b);
			EXPECT_EQ(queue->WaitFor(cmd, {}), CommandQueue::ReceiveResult::EMPTY);
		}

		EXPECT_EQ(queue->WaitFor(cmd, {}), CommandQueue::ReceiveResult::EMPTY);
	}

	EXPECT_EQ(queue->WaitFor(cmd, {}), CommandQueue::ReceiveResult::CLOSED);
}

TEST(PlayerHandle, EngineGone)
{
	auto queue = std::make_shared<CommandQueue>();
	PlayerHandle player{queue, 1s};
	queue->CloseReceiver();

	for (unsigned i = 0; i < 4; ++i) {
		try {
			switch (i) {
			case 0:
				player.Play("/tmp/a.mp3");
				break;

			case 1:
				player.Stop();
				break;

			case 2:
				player.PauseOrResume();
				break;

			case 3:
				player.GetStatus();
				break;
			}

			FAIL() << "operation " << i << " did not throw";
		} catch (const AudioError &e) {
			EXPECT_EQ(e.GetCode(), AudioErrorCode::ENGINE_UNAVAILABLE);
			EXPECT_STREQ(e.what(), "Audio engine unavailable.");
		}
	}
}

TEST(PlayerHandle, EngineExitsWithPendingCommand)
{
	auto queue = std::make_shared<CommandQueue>();
	PlayerHandle player{queue, 5s};

	/* a consumer which exits without handling the command */
	std::thread consumer([queue]{
		PlayerCommand cmd;
		while (queue->WaitFor(cmd, {}) == CommandQueue::ReceiveResult::EMPTY)
			std::this_thread::sleep_for(1ms);

		/* drop the command, breaking its promise */
		cmd = StopCommand{};
		queue->CloseReceiver();
	});

	try {
		player.GetStatus();
		FAIL() << "GetStatus() did not throw";
	} catch (const AudioError &e) {
		EXPECT_EQ(e.GetCode(), AudioErrorCode::ENGINE_UNAVAILABLE);
	}

	consumer.join();
}

TEST(PlayerHandle, Timeout)
{
	/* nobody consumes this queue */
	auto queue = std::make_shared<CommandQueue>();
	PlayerHandle player{queue, 50ms};

	try {
		player.Play("/tmp/a.mp3");
		FAIL() << "Play() did not throw";
	} catch (const AudioError &e) {
		EXPECT_EQ(e.GetCode(), AudioErrorCode::TIMEOUT);
		EXPECT_STREQ(e.what(), "Playback start timed out.");
	}

	try {
		player.GetStatus();
		FAIL() << "GetStatus() did not throw";
	} catch (const AudioError &e) {
		EXPECT_EQ(e.GetCode(), AudioErrorCode::TIMEOUT);
	}

	/* Stop() and PauseOrResume() do not wait */
	EXPECT_NO_THROW(player.Stop());
	EXPECT_NO_THROW(player.PauseOrResume());
}

TEST(AudioError, CodeNames)
{
	EXPECT_STREQ(ToString(AudioErrorCode::UNSUPPORTED_FORMAT), "unsupported_format");
	EXPECT_STREQ(ToString(AudioErrorCode::DECODE), "decode");
	EXPECT_STREQ(ToString(AudioErrorCode::NOT_FOUND), "not_found");
	EXPECT_STREQ(ToString(AudioErrorCode::IO), "io");
	EXPECT_STREQ(ToString(AudioErrorCode::ENGINE_UNAVAILABLE), "engine_unavailable");
	EXPECT_STREQ(ToString(AudioErrorCode::TIMEOUT), "timeout");
}
