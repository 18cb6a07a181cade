// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "SndfileDecoderPlugin.hxx"
#include "../DecoderPlugin.hxx"
#include "../Client.hxx"
#include "io/FileReader.hxx"
#include "pcm/CheckAudioFormat.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "util/Domain.hxx"
#include "util/ScopeExit.hxx"
#include "Log.hxx"

#include <array>
#include <cassert>
#include <cstdint>
#include <exception>

#include <sndfile.h>
#include <stdio.h>

static constexpr Domain sndfile_domain("sndfile");

static bool
sndfile_init([[maybe_unused]] const ConfigBlock &block)
{
	LogDebug(sndfile_domain, sf_version_string());
	return true;
}

static sf_count_t
sndfile_vio_get_filelen(void *user_data)
{
	const auto &file = *(const FileReader *)user_data;

	return file.GetSize();
}

static sf_count_t
sndfile_vio_seek(sf_count_t _offset, int whence, void *user_data)
{
	auto &file = *(FileReader *)user_data;

	off_t offset = _offset;
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
		return file.GetPosition();
	} catch (...) {
		LogError(std::current_exception(), "Seek failed");
		return -1;
	}
}

static sf_count_t
sndfile_vio_read(void *ptr, sf_count_t count, void *user_data)
{
	auto &file = *(FileReader *)user_data;

	/* libsndfile chokes on partial reads; therefore always force
	   full reads */
	std::span<std::byte> dest{(std::byte *)ptr, std::size_t(count)};
	std::size_t total = 0;

	try {
		while (total < dest.size()) {
			std::size_t nbytes = file.Read(dest.subspan(total));
			if (nbytes == 0)
				break;

			total += nbytes;
		}
	} catch (...) {
		LogError(std::current_exception(), "Read failed");
		return -1;
	}

	return total;
}

static sf_count_t
sndfile_vio_write([[maybe_unused]] const void *ptr,
		  [[maybe_unused]] sf_count_t count,
		  [[maybe_unused]] void *user_data)
{
	/* no writing! */
	return -1;
}

static sf_count_t
sndfile_vio_tell(void *user_data)
{
	const auto &file = *(const FileReader *)user_data;

	return file.GetPosition();
}

/**
 * This SF_VIRTUAL_IO implementation glues libsndfile and the
 * #FileReader class together.
 */
static constexpr SF_VIRTUAL_IO vio = {
	sndfile_vio_get_filelen,
	sndfile_vio_seek,
	sndfile_vio_read,
	sndfile_vio_write,
	sndfile_vio_tell,
};

[[gnu::pure]]
static SampleFormat
sndfile_sample_format(const SF_INFO &info) noexcept
{
	switch (info.format & SF_FORMAT_SUBMASK) {
	case SF_FORMAT_PCM_S8:
	case SF_FORMAT_PCM_U8:
	case SF_FORMAT_PCM_16:
		return SampleFormat::S16;

	case SF_FORMAT_FLOAT:
	case SF_FORMAT_DOUBLE:
		return SampleFormat::FLOAT;

	default:
		return SampleFormat::S32;
	}
}

static AudioFormat
CheckAudioFormat(const SF_INFO &info)
{
	return CheckAudioFormat(info.samplerate,
				sndfile_sample_format(info),
				info.channels);
}

static sf_count_t
sndfile_read_frames(SNDFILE *sf, SampleFormat format,
		    void *buffer, sf_count_t n_frames) noexcept
{
	switch (format) {
	case SampleFormat::S16:
		return sf_readf_short(sf, (short *)buffer, n_frames);

	case SampleFormat::S32:
		return sf_readf_int(sf, (int *)buffer, n_frames);

	case SampleFormat::FLOAT:
		return sf_readf_float(sf, (float *)buffer, n_frames);

	default:
		assert(false);
		return -1;
	}
}

static void
sndfile_file_decode(DecoderClient &client, FileReader &file)
{
	SF_INFO info{};

	SNDFILE *const sf = sf_open_virtual(const_cast<SF_VIRTUAL_IO *>(&vio),
					    SFM_READ, &info, &file);
	if (sf == nullptr)
		throw FmtRuntimeError("sf_open_virtual() failed: {}",
				      sf_strerror(nullptr));

	AtScopeExit(sf) { sf_close(sf); };

	const auto audio_format = CheckAudioFormat(info);

	client.Ready(audio_format);

	alignas(std::int32_t) std::array<std::byte, 16384> buffer;

	const size_t frame_size = audio_format.GetFrameSize();
	const sf_count_t read_frames = buffer.size() / frame_size;

	while (true) {
		sf_count_t num_frames =
			sndfile_read_frames(sf,
					    audio_format.format,
					    buffer.data(), read_frames);
		if (num_frames < 0)
			throw FmtRuntimeError("sf_readf() failed: {}",
					      sf_strerror(sf));

		if (num_frames == 0)
			break;

		const auto cmd =
			client.SubmitAudio(std::span{buffer}.first(num_frames * frame_size));
		if (cmd == DecoderCommand::STOP)
			break;
	}
}

/**
 * Only RIFF/WAVE is routed to libsndfile; the other formats it
 * supports are handled by the "ffmpeg" fallback.
 */
static const char *const sndfile_suffixes[] = {
	"wav",
	nullptr
};

constexpr DecoderPlugin sndfile_decoder_plugin =
	DecoderPlugin("sndfile", sndfile_file_decode)
	.WithInit(sndfile_init)
	.WithSuffixes(sndfile_suffixes);
