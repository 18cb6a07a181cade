// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "NullOutputPlugin.hxx"
#include "../OutputPlugin.hxx"
#include "../Interface.hxx"
#include "../Timer.hxx"
#include "config/Block.hxx"
#include "pcm/AudioFormat.hxx"

#include <optional>

class NullOutput final : public AudioOutput {
	const bool sync;

	std::optional<Timer> timer;

public:
	explicit NullOutput(const ConfigBlock &block)
		:sync(block.GetBlockValue("sync", true)) {}

	static AudioOutput *Create(const ConfigBlock &block) {
		return new NullOutput(block);
	}

private:
	void Open(AudioFormat &audio_format) override {
		if (sync)
			timer.emplace(audio_format);
	}

	void Close() noexcept override {
		timer.reset();
	}

	std::chrono::steady_clock::duration Delay() const noexcept override {
		return timer && timer->IsStarted()
			? timer->GetDelay()
			: std::chrono::steady_clock::duration::zero();
	}

	std::size_t Play(std::span<const std::byte> src) override {
		if (timer) {
			if (!timer->IsStarted())
				timer->Start();
			timer->Add(src.size());
		}

		return src.size();
	}

	bool Drain() override {
		return !timer || !timer->IsStarted() ||
			timer->GetDelay() == std::chrono::steady_clock::duration::zero();
	}

	void Cancel() noexcept override {
		if (timer)
			timer->Reset();
	}

	bool Pause() override {
		/* restart the clock when playback resumes */
		if (timer)
			timer->Reset();

		return true;
	}
};

const struct AudioOutputPlugin null_output_plugin = {
	"null",
	NullOutput::Create,
};
