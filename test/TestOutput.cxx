// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "output/Init.hxx"
#include "output/Interface.hxx"
#include "output/OutputPlugin.hxx"
#include "output/Registry.hxx"
#include "output/Timer.hxx"
#include "output/plugins/NullOutputPlugin.hxx"
#include "config/Block.hxx"
#include "pcm/AudioFormat.hxx"
#include "util/Exception.hxx"

#include <gtest/gtest.h>

#include <thread>
#include <vector>

#include <string.h>

using std::chrono_literals::operator""ms;

static ConfigBlock
MakeBlock(std::initializer_list<std::pair<const char *, const char *>> params)
{
	ConfigBlock block(1);
	for (const auto &[name, value] : params)
		block.AddBlockParam(name, value);
	return block;
}

TEST(OutputRegistry, ByName)
{
	EXPECT_EQ(GetAudioOutputPluginByName("null"), &null_output_plugin);
	EXPECT_EQ(GetAudioOutputPluginByName("bogus"), nullptr);
	EXPECT_NE(audio_output_plugins[0], nullptr);
}

TEST(OutputInit, MissingType)
{
	const auto block = MakeBlock({{"name", "My Output"}});

	try {
		audio_output_new(block);
		FAIL() << "audio_output_new() did not throw";
	} catch (const std::runtime_error &e) {
		EXPECT_STREQ(e.what(), "Missing \"type\" configuration");
	}
}

TEST(OutputInit, NoSuchPlugin)
{
	const auto block = MakeBlock({{"type", "pulse"}});

	try {
		audio_output_new(block);
		FAIL() << "audio_output_new() did not throw";
	} catch (const std::runtime_error &e) {
		EXPECT_STREQ(e.what(), "No such audio output plugin: pulse");
	}
}

TEST(OutputInit, PluginError)
{
	const auto block = MakeBlock({{"type", "null"}, {"sync", "maybe"}});

	try {
		audio_output_new(block);
		FAIL() << "audio_output_new() did not throw";
	} catch (const std::runtime_error &e) {
		EXPECT_STREQ(e.what(), "Failed to create audio output \"null\" (null)");

		/* the plugin's error is nested */
		EXPECT_GT(GetFullMessage(e).size(), strlen(e.what()));
	}
}

TEST(OutputInit, Name)
{
	const auto block = MakeBlock({{"type", "null"}, {"name", "silence"}});
	const auto output = audio_output_new(block);
	ASSERT_NE(output, nullptr);
}

TEST(NullOutput, NoSync)
{
	const auto block = MakeBlock({{"type", "null"}, {"sync", "no"}});
	const auto output = audio_output_new(block);

	AudioFormat af(44100, SampleFormat::FLOAT, 2);
	output->Open(af);

	const std::vector<std::byte> buffer(af.TimeToSize(std::chrono::seconds(1)));
	EXPECT_EQ(output->Play(buffer), buffer.size());
	EXPECT_EQ(output->Delay(), std::chrono::steady_clock::duration::zero());

	EXPECT_TRUE(output->Drain());
	output->Close();
}

TEST(NullOutput, Sync)
{
	const auto block = MakeBlock({{"type", "null"}});
	const auto output = audio_output_new(block);

	AudioFormat af(44100, SampleFormat::FLOAT, 2);
	output->Open(af);

	/* not started yet */
	EXPECT_EQ(output->Delay(), std::chrono::steady_clock::duration::zero());

	/* 100 ms worth of audio */
	const std::vector<std::byte> buffer(af.GetFrameSize() * 4410);
	EXPECT_EQ(output->Play(buffer), buffer.size());

	const auto delay = output->Delay();
	EXPECT_GT(delay, std::chrono::steady_clock::duration::zero());
	EXPECT_LE(delay, 100ms);

	output->Cancel();
	EXPECT_EQ(output->Delay(), std::chrono::steady_clock::duration::zero());

	EXPECT_TRUE(output->Pause());
	output->Close();
}

TEST(NullOutput, DrainDoesNotBlock)
{
	const auto block = MakeBlock({{"type", "null"}});
	const auto output = audio_output_new(block);

	AudioFormat af(44100, SampleFormat::FLOAT, 2);
	output->Open(af);

	/* nothing played yet */
	EXPECT_TRUE(output->Drain());

	/* 100 ms worth of audio */
	const std::vector<std::byte> buffer(af.GetFrameSize() * 4410);
	EXPECT_EQ(output->Play(buffer), buffer.size());

	const auto start = std::chrono::steady_clock::now();
	EXPECT_FALSE(output->Drain());
	EXPECT_LT(std::chrono::steady_clock::now() - start, 50ms);

	/* the caller waits for Delay() and retries */
	unsigned n = 0;
	while (!output->Drain()) {
		ASSERT_LT(++n, 100u);
		std::this_thread::sleep_for(output->Delay());
	}

	EXPECT_EQ(output->Delay(), std::chrono::steady_clock::duration::zero());
	output->Close();
}

TEST(Timer, Delay)
{
	Timer timer(AudioFormat(48000, SampleFormat::S16, 2));
	EXPECT_FALSE(timer.IsStarted());

	timer.Start();
	EXPECT_TRUE(timer.IsStarted());

	/* 200 ms */
	timer.Add(48000 * 4 / 5);
	const auto delay = timer.GetDelay();
	EXPECT_GT(delay, 100ms);
	EXPECT_LE(delay, 200ms);

	timer.Reset();
	EXPECT_FALSE(timer.IsStarted());
}
