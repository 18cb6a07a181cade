// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "FakeDecoderPlugins.hxx"
#include "decoder/DecoderPlugin.hxx"
#include "decoder/Client.hxx"
#include "io/FileReader.hxx"
#include "pcm/AudioFormat.hxx"

#include <array>
#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <span>
#include <string>
#include <thread>
#include <vector>

std::atomic<uint64_t> fake_submitted_frames{0};

static std::string
ReadAll(FileReader &file)
{
	std::string result;
	std::array<char, 256> buffer;

	while (true) {
		std::size_t nbytes = file.Read(std::as_writable_bytes(std::span{buffer}));
		if (nbytes == 0)
			return result;

		result.append(buffer.data(), nbytes);
	}
}

template<typename T>
static void
SubmitConstant(DecoderClient &client, SampleFormat format, T value,
	       unsigned seconds)
{
	client.Ready({FAKE_SAMPLE_RATE, format, FAKE_CHANNELS});

	/* one tenth of a second per chunk */
	const std::vector<T> chunk(FAKE_SAMPLE_RATE / 10 * FAKE_CHANNELS, value);
	for (unsigned i = 0; i < seconds * 10; ++i) {
		const auto cmd = client.SubmitAudio(std::span<const T>{chunk});
		fake_submitted_frames += FAKE_SAMPLE_RATE / 10;
		if (cmd == DecoderCommand::STOP)
			break;
	}
}

static unsigned
ParseSeconds(const std::string &contents)
{
	unsigned seconds = 0;
	for (char ch : contents)
		if (ch >= '0' && ch <= '9')
			seconds += ch - '0';

	return seconds;
}

template<typename T>
static void
FakeDecode(DecoderClient &client, FileReader &file,
	   SampleFormat format, T value)
{
	const auto contents = ReadAll(file);
	if (contents.starts_with("error"))
		throw std::runtime_error("fake decoder failure");

	if (contents.starts_with("silent"))
		return;

	if (contents.starts_with("slow"))
		std::this_thread::sleep_for(std::chrono::milliseconds(FAKE_SLOW_DELAY_MS));

	SubmitConstant(client, format, value, ParseSeconds(contents));
}

static void
FakeDecodeS16(DecoderClient &client, FileReader &file)
{
	FakeDecode<int16_t>(client, file, SampleFormat::S16, 0x4000);
}

static void
FakeDecodeS24(DecoderClient &client, FileReader &file)
{
	FakeDecode<int32_t>(client, file, SampleFormat::S24_P32, 0x400000);
}

static void
FakeDecodeS32(DecoderClient &client, FileReader &file)
{
	FakeDecode<int32_t>(client, file, SampleFormat::S32, 0x40000000);
}

static void
FakeDecodeFloat(DecoderClient &client, FileReader &file)
{
	FakeDecode<float>(client, file, SampleFormat::FLOAT,
			  FAKE_SAMPLE_VALUE);
}

const DecoderPlugin fake_mpg123_plugin{"mpg123", FakeDecodeS16};
const DecoderPlugin fake_sndfile_plugin{"sndfile", FakeDecodeS16};
const DecoderPlugin fake_flac_plugin{"flac", FakeDecodeS24};
const DecoderPlugin fake_vorbis_plugin{"vorbis", FakeDecodeFloat};
const DecoderPlugin fake_ffmpeg_plugin{"ffmpeg", FakeDecodeS32};

std::vector<const DecoderPlugin *>
GetFakeDecoderPlugins(std::string_view except)
{
	std::vector<const DecoderPlugin *> result;

	for (const auto *i : {&fake_mpg123_plugin, &fake_sndfile_plugin,
			      &fake_flac_plugin, &fake_vorbis_plugin,
			      &fake_ffmpeg_plugin})
		if (except != i->name)
			result.push_back(i);

	return result;
}
