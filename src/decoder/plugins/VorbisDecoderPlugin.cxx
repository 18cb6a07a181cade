// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "VorbisDecoderPlugin.hxx"
#include "../DecoderPlugin.hxx"
#include "../Client.hxx"
#include "io/FileReader.hxx"
#include "pcm/CheckAudioFormat.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "util/ScopeExit.hxx"
#include "Log.hxx"

#define OV_EXCLUDE_STATIC_CALLBACKS
#include <vorbis/vorbisfile.h>

#include <cerrno>
#include <exception>
#include <span>
#include <stdexcept>
#include <vector>

#include <stdio.h>

static size_t
ogg_read_cb(void *ptr, size_t size, size_t nmemb, void *data) noexcept
{
	auto &file = *(FileReader *)data;

	try {
		const size_t nbytes =
			file.Read({(std::byte *)ptr, size * nmemb});
		errno = 0;
		return nbytes / size;
	} catch (...) {
		LogError(std::current_exception(), "Read failed");
		/* libvorbisfile checks errno to tell an error from
		   end of file */
		errno = EIO;
		return 0;
	}
}

static int
ogg_seek_cb(void *data, ogg_int64_t offset, int whence) noexcept
{
	auto &file = *(FileReader *)data;

	switch (whence) {
	case SEEK_SET:
		break;

	case SEEK_CUR:
		offset += file.GetPosition();
		break;

	case SEEK_END:
		offset += file.GetSize();
		break;

	default:
		return -1;
	}

	try {
		file.Seek(offset);
		return 0;
	} catch (...) {
		LogError(std::current_exception(), "Seek failed");
		return -1;
	}
}

static long
ogg_tell_cb(void *data) noexcept
{
	const auto &file = *(const FileReader *)data;

	return (long)file.GetPosition();
}

static const ov_callbacks vorbis_file_callbacks = {
	ogg_read_cb,
	ogg_seek_cb,
	/* the FileReader is owned by the caller */
	nullptr,
	ogg_tell_cb,
};

[[gnu::const]]
static const char *
vorbis_strerror(int code) noexcept
{
	switch (code) {
	case OV_EREAD:
		return "read error";

	case OV_ENOTVORBIS:
		return "not vorbis stream";

	case OV_EVERSION:
		return "vorbis version mismatch";

	case OV_EBADHEADER:
		return "invalid vorbis header";

	case OV_EFAULT:
		return "internal logic error";

	case OV_EBADLINK:
		return "invalid stream section";

	case OV_HOLE:
		return "interruption in the data";

	default:
		return "unknown error";
	}
}

static AudioFormat
CheckAudioFormat(const vorbis_info &vi)
{
	return CheckAudioFormat(vi.rate, SampleFormat::FLOAT, vi.channels);
}

static void
vorbis_interleave(float *dest, const float *const*src,
		  unsigned nframes, unsigned channels) noexcept
{
	for (const float *const*src_end = src + channels;
	     src != src_end; ++src, ++dest) {
		float *d = dest;
		for (const float *s = *src, *s_end = s + nframes;
		     s != s_end; ++s, d += channels)
			*d = *s;
	}
}

static void
vorbis_file_decode(DecoderClient &client, FileReader &file)
{
	OggVorbis_File vf;
	if (int error = ov_open_callbacks(&file, &vf, nullptr, 0,
					  vorbis_file_callbacks);
	    error < 0)
		throw FmtRuntimeError("Failed to open Ogg Vorbis stream: {}",
				      vorbis_strerror(error));

	AtScopeExit(&vf) { ov_clear(&vf); };

	const vorbis_info *vi = ov_info(&vf, -1);
	if (vi == nullptr)
		throw std::runtime_error("ov_info() has failed");

	const auto audio_format = CheckAudioFormat(*vi);
	client.Ready(audio_format);

	std::vector<float> buffer;
	int current_section = -1;

	while (true) {
		float **per_channel;
		int section;
		const long nframes = ov_read_float(&vf, &per_channel,
						   1024, &section);
		if (nframes == OV_HOLE)
			/* recoverable; skip it */
			continue;

		if (nframes < 0)
			throw FmtRuntimeError("ov_read_float() failed: {}",
					      vorbis_strerror(int(nframes)));

		if (nframes == 0)
			break;

		if (section != current_section) {
			current_section = section;

			/* a chained stream may switch formats between
			   sections */
			vi = ov_info(&vf, section);
			if (vi == nullptr ||
			    CheckAudioFormat(*vi) != audio_format)
				throw std::runtime_error("Chained Ogg stream changes the audio format");
		}

		buffer.resize(nframes * audio_format.channels);
		vorbis_interleave(buffer.data(), per_channel,
				  nframes, audio_format.channels);

		if (client.SubmitAudio(std::span{buffer}) == DecoderCommand::STOP)
			break;
	}
}

static const char *const vorbis_suffixes[] = {
	"ogg",
	nullptr
};

constexpr DecoderPlugin vorbis_decoder_plugin =
	DecoderPlugin("vorbis", vorbis_file_decode)
	.WithSuffixes(vorbis_suffixes);
