// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "AlsaOutputPlugin.hxx"
#include "../OutputPlugin.hxx"
#include "../Interface.hxx"
#include "lib/alsa/Error.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "lib/fmt/ToBuffer.hxx"
#include "pcm/AudioFormat.hxx"
#include "config/Block.hxx"
#include "util/Domain.hxx"
#include "Log.hxx"

#include <alsa/asoundlib.h>

#include <algorithm>
#include <cassert>
#include <chrono>
#include <cstdint>
#include <string>

static constexpr Domain alsa_output_domain("alsa_output");

static constexpr char default_device[] = "default";

static constexpr unsigned DEFAULT_BUFFER_TIME = 500000;

class AlsaOutput final : public AudioOutput {
	/**
	 * The name of the ALSA device; empty for the default device.
	 */
	const std::string device;

	/**
	 * The configured buffer time in microseconds.
	 */
	const unsigned buffer_time;

	/**
	 * The libasound PCM handle.  It is opened by Enable() and
	 * stays open until Disable().
	 */
	snd_pcm_t *pcm = nullptr;

	/**
	 * The size of one audio frame passed to method play().
	 */
	std::size_t out_frame_size;

	unsigned sample_rate;

	/**
	 * Was the device opened with Open()?  Its parameters are
	 * only valid then.
	 */
	bool prepared = false;

	/**
	 * Does the hardware support snd_pcm_pause()?  Determined by
	 * Open().
	 */
	bool can_pause = false;

	/**
	 * Is the device paused with snd_pcm_pause()?  It will be
	 * resumed by the next Play() call.
	 */
	bool paused = false;

	/**
	 * The time it takes to play the frames still queued in the
	 * device.  Set by Drain() and returned by Delay() while
	 * draining.
	 */
	std::chrono::steady_clock::duration drain_delay{};

public:
	explicit AlsaOutput(const ConfigBlock &block);

	static AudioOutput *Create(const ConfigBlock &block) {
		return new AlsaOutput(block);
	}

private:
	[[gnu::pure]]
	const char *GetDevice() const noexcept {
		return device.empty() ? default_device : device.c_str();
	}

	/* virtual methods from class AudioOutput */
	void Enable() override;
	void Disable() noexcept override;

	void Open(AudioFormat &audio_format) override;
	void Close() noexcept override;

	std::chrono::steady_clock::duration Delay() const noexcept override {
		return drain_delay;
	}

	std::size_t Play(std::span<const std::byte> src) override;
	bool Drain() override;
	void Cancel() noexcept override;
	bool Pause() override;

	/**
	 * Resume a device paused by Pause().
	 *
	 * Throws on error.
	 */
	void Resume();

	/**
	 * Recover from an error returned by snd_pcm_writei().
	 *
	 * Throws on error.
	 */
	void Recover(int err);
};

AlsaOutput::AlsaOutput(const ConfigBlock &block)
	:device(block.GetBlockValue("device", "")),
	 buffer_time(block.GetPositiveValue("buffer_time",
					    DEFAULT_BUFFER_TIME))
{
}

void
AlsaOutput::Enable()
{
	int err = snd_pcm_open(&pcm, GetDevice(),
			       SND_PCM_STREAM_PLAYBACK, 0);
	if (err < 0)
		throw Alsa::MakeError(err,
				      FmtBuffer<256>("Failed to open ALSA device \"{}\"",
						     GetDevice()));

	FmtDebug(alsa_output_domain, "opened {} type={}",
		 snd_pcm_name(pcm),
		 snd_pcm_type_name(snd_pcm_type(pcm)));
}

void
AlsaOutput::Disable() noexcept
{
	assert(pcm != nullptr);

	snd_pcm_close(pcm);
	pcm = nullptr;
}

void
AlsaOutput::Open(AudioFormat &audio_format)
{
	assert(pcm != nullptr);

	if (audio_format.format != SampleFormat::FLOAT)
		throw FmtRuntimeError("Unsupported sample format: {}",
				      sample_format_to_string(audio_format.format));

	int err = snd_pcm_set_params(pcm, SND_PCM_FORMAT_FLOAT,
				     SND_PCM_ACCESS_RW_INTERLEAVED,
				     audio_format.channels,
				     audio_format.sample_rate,
				     /* allow ALSA to resample */ 1,
				     buffer_time);
	if (err < 0)
		throw Alsa::MakeError(err, "snd_pcm_set_params() failed");

	snd_pcm_hw_params_t *hw_params;
	snd_pcm_hw_params_alloca(&hw_params);
	can_pause = snd_pcm_hw_params_current(pcm, hw_params) == 0 &&
		snd_pcm_hw_params_can_pause(hw_params);

	snd_pcm_uframes_t buffer_size, period_size;
	if (snd_pcm_get_params(pcm, &buffer_size, &period_size) == 0)
		FmtDebug(alsa_output_domain,
			 "buffer_size={} period_size={}",
			 buffer_size, period_size);

	out_frame_size = audio_format.GetFrameSize();
	sample_rate = audio_format.sample_rate;
	prepared = true;
	paused = false;
}

void
AlsaOutput::Close() noexcept
{
	if (!prepared)
		return;

	snd_pcm_drop(pcm);
	prepared = false;
	paused = false;
	drain_delay = {};
}

inline void
AlsaOutput::Recover(int err)
{
	if (err == -EPIPE)
		FmtDebug(alsa_output_domain,
			 "Underrun on ALSA device \"{}\"", GetDevice());
	else if (err == -ESTRPIPE)
		FmtDebug(alsa_output_domain,
			 "ALSA device \"{}\" was suspended", GetDevice());

	err = snd_pcm_recover(pcm, err, 1);
	if (err < 0)
		throw Alsa::MakeError(err, "snd_pcm_writei() failed");
}

std::size_t
AlsaOutput::Play(std::span<const std::byte> src)
{
	assert(prepared);

	Resume();
	drain_delay = {};

	const snd_pcm_uframes_t n_frames = src.size() / out_frame_size;
	if (n_frames == 0)
		return 0;

	while (true) {
		const snd_pcm_sframes_t frames_written =
			snd_pcm_writei(pcm, src.data(), n_frames);
		if (frames_written > 0)
			return frames_written * out_frame_size;

		if (frames_written < 0 && frames_written != -EAGAIN)
			Recover(frames_written);
	}
}

inline void
AlsaOutput::Resume()
{
	if (!paused)
		return;

	paused = false;

	int err = snd_pcm_pause(pcm, /* disable */ 0);
	if (err < 0)
		throw Alsa::MakeError(err, "snd_pcm_pause() failed");
}

bool
AlsaOutput::Drain()
{
	assert(prepared);

	Resume();

	if (snd_pcm_state(pcm) == SND_PCM_STATE_PREPARED) {
		/* less than one period was written; the device has
		   not been started yet */
		int err = snd_pcm_start(pcm);
		if (err < 0)
			throw Alsa::MakeError(err, "snd_pcm_start() failed");
	}

	snd_pcm_sframes_t delay;
	int err = snd_pcm_delay(pcm, &delay);
	if (err == -EPIPE || (err == 0 && delay <= 0)) {
		/* the buffer has run empty (an underrun is expected
		   at the end); prepare the device for the next
		   Play() call */
		drain_delay = {};
		snd_pcm_drop(pcm);

		err = snd_pcm_prepare(pcm);
		if (err < 0)
			throw Alsa::MakeError(err, "snd_pcm_prepare() failed");

		return true;
	}

	if (err < 0)
		throw Alsa::MakeError(err, "snd_pcm_delay() failed");

	using std::chrono::milliseconds;
	using std::chrono::microseconds;
	const microseconds remaining(uint64_t(delay) * microseconds::period::den
				     / sample_rate);
	drain_delay = std::max<std::chrono::steady_clock::duration>(remaining,
								    milliseconds(1));
	return false;
}

void
AlsaOutput::Cancel() noexcept
{
	if (!prepared)
		return;

	snd_pcm_drop(pcm);
	snd_pcm_prepare(pcm);
	paused = false;
	drain_delay = {};
}

bool
AlsaOutput::Pause()
{
	assert(prepared);

	if (paused)
		return true;

	if (snd_pcm_state(pcm) != SND_PCM_STATE_RUNNING)
		/* nothing queued; nothing to pause */
		return true;

	if (!can_pause)
		Cancel();
	else {
		int err = snd_pcm_pause(pcm, /* enable */ 1);
		if (err < 0)
			throw Alsa::MakeError(err, "snd_pcm_pause() failed");

		paused = true;
	}

	return true;
}

const struct AudioOutputPlugin alsa_output_plugin = {
	"alsa",
	AlsaOutput::Create,
};
