// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Mpg123DecoderPlugin.hxx"
#include "../DecoderPlugin.hxx"
#include "../Client.hxx"
#include "io/FileReader.hxx"
#include "pcm/CheckAudioFormat.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "util/Domain.hxx"
#include "util/ScopeExit.hxx"
#include "util/StringBuffer.hxx"
#include "Log.hxx"

#include <mpg123.h>

#include <array>

static constexpr Domain mpg123_domain("mpg123");

static bool
vplay_mpg123_init([[maybe_unused]] const ConfigBlock &block)
{
	if (int error = mpg123_init(); error != MPG123_OK)
		throw FmtRuntimeError("mpg123_init() failed: {}",
				      mpg123_plain_strerror(error));

	return true;
}

static void
vplay_mpg123_finish() noexcept
{
	mpg123_exit();
}

/**
 * Convert libmpg123's format to an #AudioFormat instance.
 *
 * Throws on error.
 */
static AudioFormat
GetAudioFormat(mpg123_handle &handle)
{
	long rate;
	int channels, encoding;
	if (const int error = mpg123_getformat(&handle, &rate, &channels, &encoding);
	    error != MPG123_OK)
		throw FmtRuntimeError("mpg123_getformat() failed: {}",
				      mpg123_strerror(&handle));

	if (encoding != MPG123_ENC_SIGNED_16)
		/* other formats not yet implemented */
		throw FmtRuntimeError("expected MPG123_ENC_SIGNED_16, got {}",
				      encoding);

	return CheckAudioFormat(rate, channels);
}

static void
Decode(DecoderClient &client, mpg123_handle &handle)
{
	const auto audio_format = GetAudioFormat(handle);

	/* the format must not change during decoding */
	mpg123_format_none(&handle);
	mpg123_format(&handle, audio_format.sample_rate,
		      audio_format.channels, MPG123_ENC_SIGNED_16);

	FmtDebug(mpg123_domain, "stream format {}", ToString(audio_format).c_str());

	client.Ready(audio_format);

	std::array<std::byte, 8192> buffer;

	while (true) {
		size_t nbytes = 0;
		const int error = mpg123_read(&handle, buffer.data(),
					      buffer.size(), &nbytes);

		if (nbytes > 0 &&
		    client.SubmitAudio(std::span{buffer}.first(nbytes)) == DecoderCommand::STOP)
			break;

		if (error == MPG123_DONE)
			break;

		if (error == MPG123_NEW_FORMAT)
			/* already restricted to the announced format
			   above */
			continue;

		if (error != MPG123_OK)
			throw FmtRuntimeError("mpg123_read() failed: {}",
					      mpg123_strerror(&handle));
	}
}

static void
vplay_mpg123_file_decode(DecoderClient &client, FileReader &file)
{
	/* open the file */

	int error;
	mpg123_handle *const handle = mpg123_new(nullptr, &error);
	if (handle == nullptr)
		throw FmtRuntimeError("mpg123_new() failed: {}",
				      mpg123_plain_strerror(error));

	AtScopeExit(handle) { mpg123_delete(handle); };

	if (error = mpg123_open_fd(handle, file.GetFD()); error != MPG123_OK)
		throw FmtRuntimeError("libmpg123 failed to open file: {}",
				      mpg123_strerror(handle));

	AtScopeExit(handle) { mpg123_close(handle); };

	Decode(client, *handle);
}

static const char *const mpg123_suffixes[] = {
	"mp3",
	nullptr
};

constexpr DecoderPlugin mpg123_decoder_plugin =
	DecoderPlugin("mpg123", vplay_mpg123_file_decode)
	.WithInit(vplay_mpg123_init, vplay_mpg123_finish)
	.WithSuffixes(mpg123_suffixes);
