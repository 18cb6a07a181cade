// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "FlacDecoderPlugin.hxx"
#include "../DecoderPlugin.hxx"
#include "../Client.hxx"
#include "io/FileReader.hxx"
#include "pcm/CheckAudioFormat.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "util/Domain.hxx"
#include "util/ScopeExit.hxx"
#include "Log.hxx"

#include <FLAC/stream_decoder.h>

#include <cstdint>
#include <exception>
#include <span>
#include <stdexcept>
#include <utility>
#include <vector>

#if !defined(FLAC_API_VERSION_CURRENT) || FLAC_API_VERSION_CURRENT <= 7
#error libFLAC is too old
#endif

static constexpr Domain flac_domain("flac");

/**
 * OO wrapper for a FLAC__StreamDecoder.
 */
class FlacStreamDecoder {
	FLAC__StreamDecoder *decoder;

public:
	FlacStreamDecoder()
		:decoder(FLAC__stream_decoder_new()) {
		if (decoder == nullptr)
			throw std::runtime_error("FLAC__stream_decoder_new() failed");
	}

	~FlacStreamDecoder() noexcept {
		FLAC__stream_decoder_delete(decoder);
	}

	FlacStreamDecoder(const FlacStreamDecoder &) = delete;
	FlacStreamDecoder &operator=(const FlacStreamDecoder &) = delete;

	FLAC__StreamDecoder *get() noexcept {
		return decoder;
	}
};

[[gnu::const]]
static SampleFormat
FlacSampleFormat(unsigned bits_per_sample) noexcept
{
	switch (bits_per_sample) {
	case 8:
		return SampleFormat::S8;

	case 16:
		return SampleFormat::S16;

	case 24:
		return SampleFormat::S24_P32;

	case 32:
		return SampleFormat::S32;

	default:
		return SampleFormat::UNDEFINED;
	}
}

/**
 * The state shared between the libFLAC callbacks and the decoder
 * loop.  The callbacks never throw; they store decoded PCM data in
 * #chunk and errors in #error, and the loop submits it to the
 * #DecoderClient.
 */
struct FlacDecoder {
	FileReader &file;

	AudioFormat audio_format = AudioFormat::Undefined();

	/**
	 * Interleaved PCM data decoded by the write callback.
	 */
	std::vector<std::byte> buffer;
	std::span<const std::byte> chunk;

	std::exception_ptr error;

	explicit FlacDecoder(FileReader &_file) noexcept
		:file(_file) {}

	void OnStreamInfo(const FLAC__StreamMetadata_StreamInfo &info) noexcept;

	FLAC__StreamDecoderWriteStatus OnWrite(const FLAC__Frame &frame,
					       const FLAC__int32 *const buf[]) noexcept;

private:
	bool Initialize(unsigned sample_rate, unsigned bits_per_sample,
			unsigned channels) noexcept;

	template<typename T>
	void Import(const FLAC__int32 *const src[], size_t n_frames);
};

inline bool
FlacDecoder::Initialize(unsigned sample_rate, unsigned bits_per_sample,
			unsigned channels) noexcept
{
	try {
		const auto sample_format = FlacSampleFormat(bits_per_sample);
		if (sample_format == SampleFormat::UNDEFINED)
			throw FmtRuntimeError("Unsupported FLAC bit depth: {}",
					      bits_per_sample);

		audio_format = CheckAudioFormat(sample_rate, sample_format,
						channels);
		return true;
	} catch (...) {
		error = std::current_exception();
		return false;
	}
}

inline void
FlacDecoder::OnStreamInfo(const FLAC__StreamMetadata_StreamInfo &info) noexcept
{
	if (audio_format.IsDefined() || error)
		return;

	Initialize(info.sample_rate, info.bits_per_sample, info.channels);
}

template<typename T>
inline void
FlacDecoder::Import(const FLAC__int32 *const src[], size_t n_frames)
{
	const unsigned n_channels = audio_format.channels;
	buffer.resize(n_frames * n_channels * sizeof(T));

	T *dest = (T *)buffer.data();
	for (size_t i = 0; i != n_frames; ++i)
		for (unsigned c = 0; c != n_channels; ++c)
			*dest++ = (T)src[c][i];

	chunk = buffer;
}

inline FLAC__StreamDecoderWriteStatus
FlacDecoder::OnWrite(const FLAC__Frame &frame,
		     const FLAC__int32 *const buf[]) noexcept
{
	/* no STREAMINFO block: initialize from the first frame
	   header */
	if (!audio_format.IsDefined() &&
	    (error ||
	     !Initialize(frame.header.sample_rate,
			 frame.header.bits_per_sample,
			 frame.header.channels)))
		return FLAC__STREAM_DECODER_WRITE_STATUS_ABORT;

	try {
		switch (audio_format.format) {
		case SampleFormat::S8:
			Import<int8_t>(buf, frame.header.blocksize);
			break;

		case SampleFormat::S16:
			Import<int16_t>(buf, frame.header.blocksize);
			break;

		case SampleFormat::S24_P32:
		case SampleFormat::S32:
			Import<int32_t>(buf, frame.header.blocksize);
			break;

		case SampleFormat::FLOAT:
		case SampleFormat::UNDEFINED:
			return FLAC__STREAM_DECODER_WRITE_STATUS_ABORT;
		}
	} catch (...) {
		error = std::current_exception();
		return FLAC__STREAM_DECODER_WRITE_STATUS_ABORT;
	}

	return FLAC__STREAM_DECODER_WRITE_STATUS_CONTINUE;
}

static FLAC__StreamDecoderReadStatus
flac_read_cb([[maybe_unused]] const FLAC__StreamDecoder *dec,
	     FLAC__byte buffer[], size_t *bytes, void *vdata) noexcept
{
	auto &d = *(FlacDecoder *)vdata;

	try {
		*bytes = d.file.Read({(std::byte *)buffer, *bytes});
	} catch (...) {
		d.error = std::current_exception();
		*bytes = 0;
		return FLAC__STREAM_DECODER_READ_STATUS_ABORT;
	}

	return *bytes == 0
		? FLAC__STREAM_DECODER_READ_STATUS_END_OF_STREAM
		: FLAC__STREAM_DECODER_READ_STATUS_CONTINUE;
}

static FLAC__StreamDecoderSeekStatus
flac_seek_cb([[maybe_unused]] const FLAC__StreamDecoder *dec,
	     FLAC__uint64 absolute_byte_offset, void *vdata) noexcept
{
	auto &d = *(FlacDecoder *)vdata;

	try {
		d.file.Seek(absolute_byte_offset);
		return FLAC__STREAM_DECODER_SEEK_STATUS_OK;
	} catch (...) {
		LogError(std::current_exception(), "Seek failed");
		return FLAC__STREAM_DECODER_SEEK_STATUS_ERROR;
	}
}

static FLAC__StreamDecoderTellStatus
flac_tell_cb([[maybe_unused]] const FLAC__StreamDecoder *dec,
	     FLAC__uint64 *absolute_byte_offset, void *vdata) noexcept
{
	const auto &d = *(const FlacDecoder *)vdata;

	*absolute_byte_offset = d.file.GetPosition();
	return FLAC__STREAM_DECODER_TELL_STATUS_OK;
}

static FLAC__StreamDecoderLengthStatus
flac_length_cb([[maybe_unused]] const FLAC__StreamDecoder *dec,
	       FLAC__uint64 *stream_length, void *vdata) noexcept
{
	const auto &d = *(const FlacDecoder *)vdata;

	*stream_length = d.file.GetSize();
	return FLAC__STREAM_DECODER_LENGTH_STATUS_OK;
}

static FLAC__bool
flac_eof_cb([[maybe_unused]] const FLAC__StreamDecoder *dec,
	    void *vdata) noexcept
{
	const auto &d = *(const FlacDecoder *)vdata;

	return d.file.GetPosition() >= d.file.GetSize();
}

static void
flac_metadata_cb([[maybe_unused]] const FLAC__StreamDecoder *dec,
		 const FLAC__StreamMetadata *block, void *vdata) noexcept
{
	auto &d = *(FlacDecoder *)vdata;

	if (block->type == FLAC__METADATA_TYPE_STREAMINFO)
		d.OnStreamInfo(block->data.stream_info);
}

static FLAC__StreamDecoderWriteStatus
flac_write_cb([[maybe_unused]] const FLAC__StreamDecoder *dec,
	      const FLAC__Frame *frame,
	      const FLAC__int32 *const buf[], void *vdata) noexcept
{
	auto &d = *(FlacDecoder *)vdata;

	return d.OnWrite(*frame, buf);
}

static void
flac_error_cb([[maybe_unused]] const FLAC__StreamDecoder *dec,
	      FLAC__StreamDecoderErrorStatus status,
	      [[maybe_unused]] void *vdata) noexcept
{
	LogWarning(flac_domain, FLAC__StreamDecoderErrorStatusString[status]);
}

/**
 * Throw the error stored by a callback, or else an exception
 * describing the decoder state.
 */
[[noreturn]]
static void
ThrowFlacError(FlacDecoder &d, FLAC__StreamDecoder *sd)
{
	if (d.error)
		std::rethrow_exception(std::exchange(d.error, {}));

	throw std::runtime_error(FLAC__StreamDecoderStateString[FLAC__stream_decoder_get_state(sd)]);
}

static void
flac_decoder_loop(DecoderClient &client, FlacDecoder &d,
		  FLAC__StreamDecoder *sd)
{
	while (true) {
		if (!d.chunk.empty()) {
			if (client.SubmitAudio(std::exchange(d.chunk, {})) == DecoderCommand::STOP)
				return;

			continue;
		}

		switch (FLAC__stream_decoder_get_state(sd)) {
		case FLAC__STREAM_DECODER_SEARCH_FOR_METADATA:
		case FLAC__STREAM_DECODER_READ_METADATA:
		case FLAC__STREAM_DECODER_SEARCH_FOR_FRAME_SYNC:
		case FLAC__STREAM_DECODER_READ_FRAME:
			/* continue decoding */
			break;

		case FLAC__STREAM_DECODER_END_OF_STREAM:
			/* regular end of stream */
			return;

		case FLAC__STREAM_DECODER_SEEK_ERROR:
		case FLAC__STREAM_DECODER_OGG_ERROR:
		case FLAC__STREAM_DECODER_ABORTED:
		case FLAC__STREAM_DECODER_MEMORY_ALLOCATION_ERROR:
		case FLAC__STREAM_DECODER_UNINITIALIZED:
			ThrowFlacError(d, sd);
		}

		if (!FLAC__stream_decoder_process_single(sd))
			ThrowFlacError(d, sd);
	}
}

static void
flac_file_decode(DecoderClient &client, FileReader &file)
{
	FlacStreamDecoder sd;
	FlacDecoder d(file);

	const auto init_status =
		FLAC__stream_decoder_init_stream(sd.get(),
						 flac_read_cb,
						 flac_seek_cb,
						 flac_tell_cb,
						 flac_length_cb,
						 flac_eof_cb,
						 flac_write_cb,
						 flac_metadata_cb,
						 flac_error_cb,
						 &d);
	if (init_status != FLAC__STREAM_DECODER_INIT_STATUS_OK)
		throw std::runtime_error(FLAC__StreamDecoderInitStatusString[init_status]);

	AtScopeExit(&sd) { FLAC__stream_decoder_finish(sd.get()); };

	if (!FLAC__stream_decoder_process_until_end_of_metadata(sd.get()))
		ThrowFlacError(d, sd.get());

	if (!d.audio_format.IsDefined()) {
		if (d.error)
			std::rethrow_exception(d.error);

		/* no STREAMINFO block; try to initialize the decoder
		   from the first frame header */
		if (!FLAC__stream_decoder_process_single(sd.get()))
			ThrowFlacError(d, sd.get());

		if (!d.audio_format.IsDefined()) {
			if (d.error)
				std::rethrow_exception(d.error);

			/* no audio frames at all */
			return;
		}
	}

	client.Ready(d.audio_format);

	flac_decoder_loop(client, d, sd.get());
}

static const char *const flac_suffixes[] = {
	"flac",
	nullptr
};

constexpr DecoderPlugin flac_decoder_plugin =
	DecoderPlugin("flac", flac_file_decode)
	.WithSuffixes(flac_suffixes);
