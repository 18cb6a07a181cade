// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "TemporaryDirectory.hxx"
#include "SourceGlue.hxx"
#include "decoder/plugins/SndfileDecoderPlugin.hxx"
#include "decoder/DecoderPlugin.hxx"
#include "player/FormatDispatcher.hxx"
#include "player/Source.hxx"
#include "player/Error.hxx"
#include "config/Block.hxx"

#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

static void
AppendLE(std::string &dest, uint32_t value, unsigned size)
{
	for (unsigned i = 0; i < size; ++i)
		dest.push_back(char((value >> (8 * i)) & 0xff));
}

/**
 * Build a 16 bit PCM RIFF/WAVE file where every sample has the given
 * value.
 */
static std::string
MakeWave(unsigned sample_rate, unsigned channels, unsigned n_frames,
	 int16_t value)
{
	const unsigned block_align = channels * 2;
	const unsigned data_size = n_frames * block_align;

	std::string wave = "RIFF";
	AppendLE(wave, 36 + data_size, 4);
	wave += "WAVEfmt ";
	AppendLE(wave, 16, 4);
	AppendLE(wave, 1, 2); // PCM
	AppendLE(wave, channels, 2);
	AppendLE(wave, sample_rate, 4);
	AppendLE(wave, sample_rate * block_align, 4);
	AppendLE(wave, block_align, 2);
	AppendLE(wave, 16, 2);
	wave += "data";
	AppendLE(wave, data_size, 4);

	for (unsigned i = 0; i < n_frames * channels; ++i)
		AppendLE(wave, uint16_t(value), 2);

	return wave;
}

class SndfileDecoderTest : public ::testing::Test {
protected:
	TemporaryDirectory directory;
	const FormatDispatcher dispatcher{
		std::vector<const DecoderPlugin *>{&sndfile_decoder_plugin},
	};

	CountingSourceListener listener;

	void SetUp() override {
		ASSERT_TRUE(sndfile_decoder_plugin.Init(ConfigBlock{}));
	}
};

TEST_F(SndfileDecoderTest, Stereo)
{
	const auto path = directory.WriteFile("tone.wav",
					      MakeWave(22050, 2, 10000, 16384));

	const auto source = dispatcher.Decode(path.c_str(), listener);
	EXPECT_EQ(source->GetPath(), path);
	EXPECT_EQ(source->GetAudioFormat(),
		  AudioFormat(22050, SampleFormat::FLOAT, 2));

	const auto samples = ReadAllSamples(*source);
	EXPECT_EQ(samples.size(), 2 * 10000u);

	for (float sample : samples)
		ASSERT_FLOAT_EQ(sample, 0.5f);
}

TEST_F(SndfileDecoderTest, Mono)
{
	const auto path = directory.WriteFile("mono.WAV",
					      MakeWave(8000, 1, 100, -32768));

	const auto source = dispatcher.Decode(path.c_str(), listener);
	EXPECT_EQ(source->GetAudioFormat(),
		  AudioFormat(8000, SampleFormat::FLOAT, 1));

	const auto samples = ReadAllSamples(*source);
	ASSERT_EQ(samples.size(), 100u);
	EXPECT_FLOAT_EQ(samples.front(), -1.0f);
}

TEST_F(SndfileDecoderTest, Corrupt)
{
	const auto path = directory.WriteFile("corrupt.wav",
					      "this is not a RIFF file");

	try {
		dispatcher.Decode(path.c_str(), listener);
		FAIL() << "Decode() did not throw";
	} catch (const AudioError &e) {
		EXPECT_EQ(e.GetCode(), AudioErrorCode::DECODE);
		EXPECT_EQ(std::string_view{e.what()}.substr(0, 22),
			  "WAV: sf_open_virtual()");
	}
}

TEST_F(SndfileDecoderTest, NoPlugin)
{
	/* the ".mp3" route needs "mpg123" which is not in the list */
	const auto path = directory.WriteFile("song.mp3", "ID3");

	try {
		dispatcher.Decode(path.c_str(), listener);
		FAIL() << "Decode() did not throw";
	} catch (const AudioError &e) {
		EXPECT_EQ(e.GetCode(), AudioErrorCode::DECODE);
		EXPECT_STREQ(e.what(),
			     "MP3: decoder plugin 'mpg123' is not available");
	}
}
