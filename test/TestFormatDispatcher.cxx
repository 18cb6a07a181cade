// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "FakeDecoderPlugins.hxx"
#include "SourceGlue.hxx"
#include "TemporaryDirectory.hxx"
#include "player/FormatDispatcher.hxx"
#include "player/Error.hxx"
#include "decoder/DecoderList.hxx"
#include "decoder/DecoderPlugin.hxx"

#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <thread>

/**
 * Run FormatDispatcher::Decode() and return the error it throws.
 */
static AudioError
DecodeError(const FormatDispatcher &dispatcher, const std::string &path)
{
	CountingSourceListener listener;

	try {
		dispatcher.Decode(path.c_str(), listener);
	} catch (const AudioError &e) {
		return e;
	}

	ADD_FAILURE() << "No error decoding " << path;
	return {AudioErrorCode::IO, "no error"};
}

class FormatDispatcherTest : public ::testing::Test {
protected:
	TemporaryDirectory directory;
	const FormatDispatcher dispatcher{GetFakeDecoderPlugins()};
	CountingSourceListener listener;
};

TEST_F(FormatDispatcherTest, SupportedFormats)
{
	for (const char *name : {"a.mp3", "b.wav", "c.flac", "d.ogg"}) {
		const auto path = directory.WriteFile(name, "1");
		const auto source = dispatcher.Decode(path.c_str(), listener);

		EXPECT_EQ(source->GetPath(), path);
		EXPECT_EQ(source->GetAudioFormat(),
			  AudioFormat(FAKE_SAMPLE_RATE, SampleFormat::FLOAT,
				      FAKE_CHANNELS));

		const auto samples = ReadAllSamples(*source);
		EXPECT_EQ(samples.size(), FAKE_SAMPLE_RATE * FAKE_CHANNELS);
		ASSERT_FALSE(samples.empty());
		EXPECT_FLOAT_EQ(samples.front(), FAKE_SAMPLE_VALUE);
		EXPECT_FLOAT_EQ(samples.back(), FAKE_SAMPLE_VALUE);
	}

	/* the decoder thread has reported its progress */
	EXPECT_GT(listener.n_calls, 0u);
}

TEST_F(FormatDispatcherTest, ReadIsLimited)
{
	const auto path = directory.WriteFile("a.wav", "1");
	const auto source = dispatcher.Decode(path.c_str(), listener);

	const std::size_t frame_size = source->GetAudioFormat().GetFrameSize();

	/* at least one frame even if the limit is smaller */
	auto samples = source->Read(1);
	EXPECT_EQ(samples.size(), FAKE_CHANNELS);

	samples = source->Read(frame_size * 10);
	EXPECT_EQ(samples.size(), 10 * FAKE_CHANNELS);

	/* partially consumed chunks continue where they left off */
	source->Consume(FAKE_CHANNELS);
	samples = source->Read(frame_size * Source::CHUNK_FRAMES);
	EXPECT_EQ(samples.size(), (Source::CHUNK_FRAMES - 1) * FAKE_CHANNELS);
}

TEST_F(FormatDispatcherTest, LongFileIsStreamed)
{
	/* half an hour */
	const auto path = directory.WriteFile("long.flac", std::string(200, '9'));

	fake_submitted_frames = 0;

	const auto start = std::chrono::steady_clock::now();
	auto source = dispatcher.Decode(path.c_str(), listener);
	EXPECT_LT(std::chrono::steady_clock::now() - start,
		  std::chrono::seconds(2));

	/* the decoder waits while the pipe is full */
	std::this_thread::sleep_for(std::chrono::milliseconds(300));
	const uint64_t max_buffered = Source::PIPE_CHUNKS * Source::CHUNK_FRAMES
		+ 2 * (FAKE_SAMPLE_RATE / 10) + Source::CHUNK_FRAMES;
	EXPECT_LE(fake_submitted_frames.load(), max_buffered);

	/* consuming lets it continue */
	const auto samples = source->Read(SIZE_MAX);
	ASSERT_FALSE(samples.empty());
	source->Consume(samples.size());
	std::this_thread::sleep_for(std::chrono::milliseconds(300));
	EXPECT_GT(fake_submitted_frames.load(), 0u);
	EXPECT_FALSE(source->IsDrained());

	/* destroying the Source stops the decoder */
	source.reset();
	const uint64_t after_stop = fake_submitted_frames;
	std::this_thread::sleep_for(std::chrono::milliseconds(100));
	EXPECT_EQ(fake_submitted_frames.load(), after_stop);
	EXPECT_LT(after_stop, uint64_t(1800) * FAKE_SAMPLE_RATE);
}

TEST_F(FormatDispatcherTest, SuffixIsCaseInsensitive)
{
	const auto path = directory.WriteFile("loud.FLAC", "error");
	const auto e = DecodeError(dispatcher, path);
	EXPECT_EQ(e.GetCode(), AudioErrorCode::DECODE);
	EXPECT_STREQ(e.what(), "FLAC: fake decoder failure");
}

TEST_F(FormatDispatcherTest, Fallback)
{
	/* unknown suffixes go to "ffmpeg" */
	auto path = directory.WriteFile("song.opus", "1");
	auto source = dispatcher.Decode(path.c_str(), listener);
	EXPECT_EQ(ReadAllSamples(*source).size(),
		  FAKE_SAMPLE_RATE * FAKE_CHANNELS);

	path = directory.WriteFile("no_suffix", "error");
	auto e = DecodeError(dispatcher, path);
	EXPECT_EQ(e.GetCode(), AudioErrorCode::DECODE);
	EXPECT_STREQ(e.what(), "Decode: fake decoder failure");

	/* only the last path component is examined */
	directory.MakeDirectory("album.mp3");
	path = directory.WriteFile("album.mp3/track", "silent");
	e = DecodeError(dispatcher, path);
	EXPECT_STREQ(e.what(), "Decode: no audio stream");
}

TEST_F(FormatDispatcherTest, Unsupported)
{
	/* rejected without looking at the file */
	for (const char *name : {"x.m4a", "x.aac", "X.M4A", "dir/missing.aac"}) {
		const auto e = DecodeError(dispatcher, directory.Child(name));
		EXPECT_EQ(e.GetCode(), AudioErrorCode::UNSUPPORTED_FORMAT);
		EXPECT_STREQ(e.what(),
			     "M4A/AAC not supported. Use MP3, WAV, FLAC, or OGG.");
	}

	const auto path = directory.WriteFile("real.m4a", "1");
	EXPECT_EQ(DecodeError(dispatcher, path).GetCode(),
		  AudioErrorCode::UNSUPPORTED_FORMAT);
}

TEST_F(FormatDispatcherTest, NotFound)
{
	for (const char *name : {"missing.mp3", "missing.wav",
				 "missing.flac", "missing.ogg",
				 "missing.xyz"}) {
		const auto e = DecodeError(dispatcher, directory.Child(name));
		EXPECT_EQ(e.GetCode(), AudioErrorCode::NOT_FOUND);
		EXPECT_STREQ(e.what(), "File not found.");
	}

	/* ENOTDIR */
	const auto file = directory.WriteFile("file.wav", "1");
	const auto e = DecodeError(dispatcher, file + "/x.mp3");
	EXPECT_EQ(e.GetCode(), AudioErrorCode::NOT_FOUND);
}

TEST_F(FormatDispatcherTest, IOError)
{
	const std::string path = directory.Child(std::string(4096, 'a') + ".mp3");
	const auto e = DecodeError(dispatcher, path);
	EXPECT_EQ(e.GetCode(), AudioErrorCode::IO);
	EXPECT_STREQ(e.what(), "File name too long");
}

TEST_F(FormatDispatcherTest, DecodeErrors)
{
	auto path = directory.WriteFile("broken.mp3", "error");
	auto e = DecodeError(dispatcher, path);
	EXPECT_EQ(e.GetCode(), AudioErrorCode::DECODE);
	EXPECT_STREQ(e.what(), "MP3: fake decoder failure");

	path = directory.WriteFile("broken.wav", "error");
	EXPECT_STREQ(DecodeError(dispatcher, path).what(),
		     "WAV: fake decoder failure");

	path = directory.WriteFile("broken.ogg", "silent");
	e = DecodeError(dispatcher, path);
	EXPECT_EQ(e.GetCode(), AudioErrorCode::DECODE);
	EXPECT_STREQ(e.what(), "Vorbis: no audio stream");
}

TEST_F(FormatDispatcherTest, PluginNotAvailable)
{
	const FormatDispatcher without_vorbis{GetFakeDecoderPlugins("vorbis")};

	const auto path = directory.WriteFile("a.ogg", "1");
	const auto e = DecodeError(without_vorbis, path);
	EXPECT_EQ(e.GetCode(), AudioErrorCode::DECODE);
	EXPECT_STREQ(e.what(), "Vorbis: decoder plugin 'vorbis' is not available");

	/* the other formats still work */
	const auto mp3 = directory.WriteFile("a.mp3", "1");
	EXPECT_FALSE(without_vorbis.Decode(mp3.c_str(), listener)->IsDrained());
}

TEST_F(FormatDispatcherTest, EmptyStream)
{
	/* a stream with zero frames is decoded successfully */
	const auto path = directory.WriteFile("empty.wav", "0");
	const auto source = dispatcher.Decode(path.c_str(), listener);
	EXPECT_TRUE(source->IsDrained());
	EXPECT_TRUE(source->GetAudioFormat().IsDefined());
	EXPECT_TRUE(source->Read(SIZE_MAX).empty());
}

TEST_F(FormatDispatcherTest, RoutesMatchPluginSuffixes)
{
	/* every suffix a built-in plugin claims is routed to that
	   plugin */
	const std::map<std::string_view, std::string_view> prefixes{
		{"mpg123", "MP3: "},
		{"sndfile", "WAV: "},
		{"flac", "FLAC: "},
		{"vorbis", "Vorbis: "},
		{"ffmpeg", "Decode: "},
	};

	for (unsigned n = 0; decoder_plugins[n] != nullptr; ++n) {
		const auto *plugin = decoder_plugins[n];
		const auto i = prefixes.find(plugin->name);
		ASSERT_NE(i, prefixes.end()) << plugin->name;

		if (plugin->suffixes == nullptr)
			continue;

		for (const char *const*s = plugin->suffixes; *s != nullptr; ++s) {
			const std::string suffix = *s;
			if (suffix == "m4a" || suffix == "aac")
				/* rejected before routing */
				continue;

			const auto path = directory.WriteFile("x." + suffix,
							      "error");
			const auto e = DecodeError(dispatcher, path);
			EXPECT_EQ(std::string_view{e.what()},
				  std::string(i->second) + "fake decoder failure")
				<< plugin->name << " " << suffix;
		}
	}
}
