// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "FfmpegDecoderPlugin.hxx"
#include "FfmpegIo.hxx"
#include "../DecoderPlugin.hxx"
#include "../Client.hxx"
#include "lib/ffmpeg/Codec.hxx"
#include "lib/ffmpeg/Domain.hxx"
#include "lib/ffmpeg/Error.hxx"
#include "lib/ffmpeg/Format.hxx"
#include "lib/ffmpeg/Frame.hxx"
#include "lib/ffmpeg/Init.hxx"
#include "lib/ffmpeg/Interleave.hxx"
#include "lib/ffmpeg/SampleFormat.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "pcm/CheckAudioFormat.hxx"
#include "util/ScopeExit.hxx"
#include "Log.hxx"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/samplefmt.h>
}

#include <new>
#include <vector>

static bool
ffmpeg_init([[maybe_unused]] const ConfigBlock &block)
{
	FfmpegInit();
	return true;
}

static SampleFormat
ffmpeg_sample_format(AVSampleFormat sample_fmt)
{
	const auto result = Ffmpeg::FromFfmpegSampleFormat(sample_fmt);
	if (result != SampleFormat::UNDEFINED)
		return result;

	char buffer[64];
	const char *name = av_get_sample_fmt_string(buffer, sizeof(buffer),
						    sample_fmt);
	if (name != nullptr)
		throw FmtRuntimeError("Unsupported libavcodec sample format: {} ({})",
				      name, int(sample_fmt));
	else
		throw FmtRuntimeError("Unsupported libavcodec sample format: {}",
				      int(sample_fmt));
}

/**
 * Receive all pending frames from the decoder and submit them.
 */
static DecoderCommand
FfmpegReceiveFrames(DecoderClient &client, AVCodecContext &codec_context,
		    Ffmpeg::Frame &frame, std::vector<std::byte> &buffer)
{
	while (true) {
		int err = avcodec_receive_frame(&codec_context, frame.get());
		switch (err) {
		case 0:
			{
				AtScopeExit(&frame) { frame.Unref(); };
				const auto cmd =
					client.SubmitAudio(Ffmpeg::InterleaveFrame(*frame,
										   buffer));
				if (cmd != DecoderCommand::NONE)
					return cmd;
			}
			break;

		case AVERROR(EAGAIN):
			/* need to call avcodec_send_packet() */
		case AVERROR_EOF:
			return DecoderCommand::NONE;

		default:
			throw MakeFfmpegError(err, "avcodec_receive_frame() failed");
		}
	}
}

static DecoderCommand
FfmpegSendPacket(DecoderClient &client, AVCodecContext &codec_context,
		 const AVPacket *packet,
		 Ffmpeg::Frame &frame, std::vector<std::byte> &buffer)
{
	int err = avcodec_send_packet(&codec_context, packet);
	switch (err) {
	case 0:
	case AVERROR_EOF:
		break;

	case AVERROR_INVALIDDATA:
		/* skip damaged packets */
		FmtWarning(ffmpeg_domain,
			   "avcodec_send_packet() failed: {}",
			   MakeFfmpegError(err).what());
		return DecoderCommand::NONE;

	default:
		throw MakeFfmpegError(err, "avcodec_send_packet() failed");
	}

	return FfmpegReceiveFrames(client, codec_context, frame, buffer);
}

static void
FfmpegDecode(DecoderClient &client, AVFormatContext &format_context)
{
	const int audio_stream =
		av_find_best_stream(&format_context, AVMEDIA_TYPE_AUDIO,
				    -1, -1, nullptr, 0);
	if (audio_stream < 0)
		/* the caller reports "no audio stream" */
		return;

	AVStream &av_stream = *format_context.streams[audio_stream];

	const auto &codec_params = *av_stream.codecpar;

	if (const AVCodecDescriptor *codec_descriptor =
	    avcodec_descriptor_get(codec_params.codec_id);
	    codec_descriptor != nullptr)
		FmtDebug(ffmpeg_domain, "codec '{}'",
			 codec_descriptor->name);

	const AVCodec *codec = avcodec_find_decoder(codec_params.codec_id);
	if (codec == nullptr)
		throw std::runtime_error("Unsupported audio codec");

	Ffmpeg::CodecContext codec_context(*codec);
	codec_context.FillFromParameters(codec_params);
	codec_context.Open(*codec);

	const SampleFormat sample_format =
		ffmpeg_sample_format(codec_context->sample_fmt);

	const auto audio_format =
		CheckAudioFormat(codec_context->sample_rate,
				 sample_format,
				 codec_context->ch_layout.nb_channels);

	client.Ready(audio_format);

	Ffmpeg::Frame frame;
	std::vector<std::byte> interleaved_buffer;

	AVPacket *packet = av_packet_alloc();
	if (packet == nullptr)
		throw std::bad_alloc();

	AtScopeExit(&packet) { av_packet_free(&packet); };

	while (av_read_frame(&format_context, packet) >= 0) {
		AtScopeExit(packet) { av_packet_unref(packet); };

		if (packet->size > 0 && packet->stream_index == audio_stream &&
		    FfmpegSendPacket(client, *codec_context, packet,
				     frame, interleaved_buffer) == DecoderCommand::STOP)
			return;
	}

	/* flush the decoder */
	FfmpegSendPacket(client, *codec_context, nullptr,
			 frame, interleaved_buffer);
}

static void
ffmpeg_file_decode(DecoderClient &client, FileReader &file)
{
	AvioStream stream(file);
	stream.Open();

	Ffmpeg::FormatContext format_context(stream.io);

	const auto *input_format = format_context->iformat;
	if (input_format->long_name == nullptr)
		FmtDebug(ffmpeg_domain, "detected input format '{}'",
			 input_format->name);
	else
		FmtDebug(ffmpeg_domain, "detected input format '{}' ({})",
			 input_format->name, input_format->long_name);

	format_context.FindStreamInfo();

	FfmpegDecode(client, *format_context);
}

/**
 * A list of extensions found for the formats supported by ffmpeg.
 * This decoder is the fallback for all other suffixes, so the list
 * is informational.
 */
static const char *const ffmpeg_suffixes[] = {
	"16sv", "3g2", "3gp", "aif", "aifc", "aiff", "al", "alaw",
	"amr", "ape", "au", "caf", "dts", "eac3", "gsm", "mka", "mkv", "mp2",
	"mpc", "nut", "oga", "ofr", "ofs", "opus", "ra", "rm", "shn",
	"spx", "tta", "voc", "vqf", "w64", "webm", "wma", "wv",
	nullptr
};

constexpr DecoderPlugin ffmpeg_decoder_plugin =
	DecoderPlugin("ffmpeg", ffmpeg_file_decode)
	.WithInit(ffmpeg_init)
	.WithSuffixes(ffmpeg_suffixes);
