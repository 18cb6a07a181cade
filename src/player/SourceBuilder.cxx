// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "SourceBuilder.hxx"
#include "Source.hxx"
#include "pcm/CheckAudioFormat.hxx"
#include "pcm/FloatConvert.hxx"

#include <stdexcept>
#include <utility>

void
SourceBuilder::Ready(AudioFormat audio_format)
{
	if (IsReady())
		throw std::logic_error("Decoder announced the audio format twice");

	in_format = CheckAudioFormat(audio_format.sample_rate,
				     audio_format.format,
				     audio_format.channels);
	chunk_samples = Source::CHUNK_FRAMES * in_format.channels;

	source.SetAudioFormat(AudioFormat(in_format.sample_rate,
					  SampleFormat::FLOAT,
					  in_format.channels));
}

DecoderCommand
SourceBuilder::SubmitAudio(std::span<const std::byte> audio)
{
	if (!IsReady())
		throw std::logic_error("Decoder submitted audio before announcing the format");

	if (stopped)
		return DecoderCommand::STOP;

	if (audio.size() % in_format.GetFrameSize() != 0)
		throw std::invalid_argument("Partial audio frame");

	PcmAppendFloat(pending, in_format.format, audio);

	std::size_t offset = 0;
	while (pending.size() - offset >= chunk_samples) {
		const auto begin = pending.begin() + offset;
		if (!source.Push(std::vector<float>(begin, begin + chunk_samples))) {
			stopped = true;
			return DecoderCommand::STOP;
		}

		offset += chunk_samples;
	}

	pending.erase(pending.begin(), pending.begin() + offset);
	return DecoderCommand::NONE;
}

void
SourceBuilder::Flush()
{
	if (!stopped && !pending.empty() &&
	    !source.Push(std::exchange(pending, {})))
		stopped = true;
}
