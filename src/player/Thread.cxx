// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

/*
 * The main loop of the player thread.  It owns the #AudioOutput and
 * the #Sink, receives commands from the #CommandQueue and feeds the
 * output in between.
 */

#include "Engine.hxx"
#include "CommandQueue.hxx"
#include "FormatDispatcher.hxx"
#include "Sink.hxx"
#include "Domain.hxx"
#include "output/Interface.hxx"
#include "pcm/AudioFormat.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "util/Exception.hxx"
#include "util/StringBuffer.hxx"
#include "Log.hxx"

#include <cassert>

/**
 * The approximate number of bytes written to the output per
 * iteration; this limits the command latency while playing.
 */
static constexpr std::size_t CHUNK_SIZE = 4096;

class Player final : SourceListener {
	AudioOutput &output;

	const FormatDispatcher &dispatcher;

	CommandQueue &queue;

	Sink sink;

	/**
	 * Has AudioOutput::Open() been called successfully?
	 */
	bool output_open = false;

	/**
	 * Has the sink run empty, and is the output playing the rest
	 * of its buffer?  Only valid if #output_open is set.
	 */
	bool draining = false;

	/**
	 * The format the output was opened with.  Only valid if
	 * #output_open is set.
	 */
	AudioFormat output_format = AudioFormat::Undefined();

public:
	Player(AudioOutput &_output, const FormatDispatcher &_dispatcher,
	       CommandQueue &_queue) noexcept
		:output(_output), dispatcher(_dispatcher), queue(_queue) {}

	Player(const Player &) = delete;
	Player &operator=(const Player &) = delete;

	/**
	 * The main loop; returns after the last #PlayerHandle has
	 * been destroyed and all commands have been handled.
	 */
	void Run() noexcept;

private:
	void ProcessCommand(PlayerCommand &&cmd) noexcept;

	void Process(PlayCommand &cmd) noexcept;
	void Process(StopCommand &cmd) noexcept;
	void Process(PauseCommand &cmd) noexcept;
	void Process(StatusCommand &cmd) noexcept;

	/**
	 * Is the output ready to accept more data?
	 */
	[[gnu::pure]]
	bool IsOutputReady() const noexcept {
		return !output_open ||
			output.Delay() <= std::chrono::steady_clock::duration::zero();
	}

	/**
	 * Write the next chunk of the current source to the output,
	 * opening the output if necessary.  Output errors are logged,
	 * and the sink is cleared.
	 */
	void PlayNextChunk() noexcept;

	/**
	 * Let the output play the rest of its buffer and close it
	 * when done.
	 */
	void DrainOutput() noexcept;

	/**
	 * (Re)open the output with the specified format.
	 *
	 * Throws on error.
	 */
	void OpenOutput(const AudioFormat &audio_format);

	void CloseOutput() noexcept;

	/**
	 * Discard the audio in the device buffer.
	 */
	void CancelOutput() noexcept {
		draining = false;

		if (output_open)
			output.Cancel();
	}

	/* virtual methods from class SourceListener */
	void OnSourceData() noexcept override {
		queue.WakeUp();
	}
};

void
Player::OpenOutput(const AudioFormat &audio_format)
{
	CloseOutput();

	AudioFormat out_format = audio_format;
	output.Open(out_format);
	output_open = true;
	output_format = audio_format;

	if (out_format != audio_format)
		throw FmtRuntimeError("Output does not support {}, wants {}",
				      ToString(audio_format).c_str(),
				      ToString(out_format).c_str());

	FmtDebug(player_domain, "opened output with {}",
		 ToString(audio_format).c_str());
}

void
Player::CloseOutput() noexcept
{
	draining = false;

	if (!output_open)
		return;

	output.Close();
	output_open = false;
	output_format.Clear();
}

inline void
Player::DrainOutput() noexcept
try {
	assert(output_open);
	assert(draining);

	if (output.Drain()) {
		CloseOutput();
		LogDebug(player_domain, "end of sink");
	}
} catch (...) {
	LogError(std::current_exception(), "Failed to drain the output");
	CloseOutput();
}

inline void
Player::PlayNextChunk() noexcept
try {
	const auto samples = sink.Read(CHUNK_SIZE);
	if (samples.empty()) {
		if (sink.IsEmpty() && output_open) {
			/* the last source has ended */
			draining = true;
			DrainOutput();
		}

		/* else the decoder has not caught up yet; its
		   SourceListener call will wake us up */
		return;
	}

	const AudioFormat &audio_format = sink.GetCurrent()->GetAudioFormat();
	if (!output_open || output_format != audio_format)
		OpenOutput(audio_format);

	draining = false;

	const std::size_t nbytes = output.Play(std::as_bytes(samples));
	assert(nbytes % output_format.GetFrameSize() == 0);

	sink.Consume(nbytes / sizeof(float));
} catch (...) {
	LogError(std::current_exception(), "Audio output failed");

	sink.Clear();
	CancelOutput();
	CloseOutput();
}

inline void
Player::Process(PlayCommand &cmd) noexcept
{
	FmtDebug(player_domain, "play \"{}\"", cmd.path);

	/* the old contents are discarded even if the new file
	   cannot be decoded */
	sink.Stop();
	CancelOutput();

	try {
		auto source = dispatcher.Decode(cmd.path.c_str(), *this);

		FmtInfo(player_domain, "playing \"{}\" ({})",
			source->GetPath(),
			ToString(source->GetAudioFormat()).c_str());

		sink.Append(std::move(source));

		if (cmd.result)
			cmd.result->set_value();
	} catch (...) {
		FmtWarning(player_domain, "Failed to play \"{}\": {}",
			   cmd.path, GetFullMessage(std::current_exception()));

		if (cmd.result)
			cmd.result->set_exception(std::current_exception());
	}
}

inline void
Player::Process(StopCommand &) noexcept
{
	LogDebug(player_domain, "stop");

	sink.Stop();
	CancelOutput();
	CloseOutput();
}

inline void
Player::Process(PauseCommand &) noexcept
{
	const bool paused = sink.TogglePause();
	FmtDebug(player_domain, "pause {}", paused ? "on" : "off");

	if (paused && output_open) {
		try {
			if (!output.Pause())
				CloseOutput();
		} catch (...) {
			LogError(std::current_exception(),
				 "Failed to pause the output");
			CloseOutput();
		}
	}
}

inline void
Player::Process(StatusCommand &cmd) noexcept
{
	LogDebug(player_domain, "status");

	cmd.result.set_value(sink.GetStatus());
}

inline void
Player::ProcessCommand(PlayerCommand &&cmd) noexcept
{
	std::visit([this](auto &c){ Process(c); }, cmd);
}

void
Player::Run() noexcept
{
	while (true) {
		PlayerCommand cmd;

		CommandQueue::ReceiveResult result;
		if (sink.IsPlaying() && sink.IsReadable())
			result = queue.WaitFor(cmd, output_open
					       ? output.Delay()
					       : std::chrono::steady_clock::duration::zero());
		else if (draining && !sink.IsPaused())
			result = queue.WaitFor(cmd, output.Delay());
		else
			/* idle, paused or waiting for a decoder */
			result = queue.Wait(cmd);

		switch (result) {
		case CommandQueue::ReceiveResult::COMMAND:
			ProcessCommand(std::move(cmd));
			break;

		case CommandQueue::ReceiveResult::EMPTY:
			if (sink.IsPlaying()) {
				/* a decoder may have woken us up before
				   the output is ready */
				if (IsOutputReady())
					PlayNextChunk();
			} else if (draining && !sink.IsPaused())
				DrainOutput();
			break;

		case CommandQueue::ReceiveResult::CLOSED:
			sink.Stop();
			CancelOutput();
			CloseOutput();
			return;
		}
	}
}

void
AudioEngine::RunThread() noexcept
{
	std::unique_ptr<AudioOutput> output;

	try {
		output = output_factory();
		output->Enable();
	} catch (...) {
		queue->CloseReceiver();
		SignalStartup(std::current_exception());
		return;
	}

	SignalStartup({});

	LogInfo(player_domain, "audio engine started");

	{
		Player player(*output, dispatcher, *queue);
		player.Run();
	}

	queue->CloseReceiver();

	output->Disable();
	output.reset();

	LogInfo(player_domain, "audio engine stopped");
}
