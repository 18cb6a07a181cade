// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Source.hxx"
#include "SourceBuilder.hxx"
#include "Error.hxx"
#include "decoder/DecoderPlugin.hxx"
#include "decoder/Domain.hxx"
#include "util/Exception.hxx"
#include "Log.hxx"

#include <fmt/core.h>

#include <algorithm>
#include <cassert>

Source::Source(std::string _path, const DecoderPlugin &_plugin,
	       const char *_error_prefix, FileReader &&_file,
	       SourceListener &_listener) noexcept
	:path(std::move(_path)), plugin(_plugin),
	 error_prefix(_error_prefix), file(std::move(_file)),
	 listener(_listener),
	 thread("decoder", [this]{ RunThread(); })
{
}

Source::~Source() noexcept
{
	{
		const std::scoped_lock<std::mutex> lock(mutex);
		stop = true;
		cond.notify_one();
	}

	if (thread.IsDefined())
		thread.Join();
}

void
Source::Start()
{
	thread.Start();

	std::unique_lock<std::mutex> lock(mutex);
	client_cond.wait(lock, [this]{ return finished || !chunks.empty(); });

	if (error)
		throw AudioError{AudioErrorCode::DECODE,
				 error_prefix + GetFullMessage(error)};

	if (!audio_format.IsDefined())
		throw AudioError{AudioErrorCode::DECODE,
				 fmt::format("{}no audio stream", error_prefix)};
}

bool
Source::IsDrained() const noexcept
{
	const std::scoped_lock<std::mutex> lock(mutex);
	return finished && chunks.empty();
}

bool
Source::IsReadable() const noexcept
{
	const std::scoped_lock<std::mutex> lock(mutex);
	return finished || !chunks.empty();
}

std::span<const float>
Source::Read(std::size_t max_bytes) noexcept
{
	const std::vector<float> *chunk;

	{
		const std::scoped_lock<std::mutex> lock(mutex);
		if (chunks.empty())
			return {};

		/* the decoder thread only appends; this reference
		   stays valid until Consume() removes the chunk */
		chunk = &chunks.front();
	}

	assert(position < chunk->size());

	const std::size_t frame_size = audio_format.GetFrameSize();
	const std::size_t max_samples =
		std::max<std::size_t>(max_bytes / frame_size, 1)
		* audio_format.channels;

	std::span<const float> result{*chunk};
	result = result.subspan(position);
	return result.first(std::min(result.size(), max_samples));
}

void
Source::Consume(std::size_t n_samples) noexcept
{
	position += n_samples;

	const std::scoped_lock<std::mutex> lock(mutex);
	assert(!chunks.empty());
	assert(position <= chunks.front().size());

	if (position == chunks.front().size()) {
		chunks.pop_front();
		position = 0;
		cond.notify_one();
	}
}

void
Source::SetAudioFormat(AudioFormat _audio_format) noexcept
{
	const std::scoped_lock<std::mutex> lock(mutex);
	audio_format = _audio_format;
}

bool
Source::Push(std::vector<float> &&chunk)
{
	bool was_empty;

	{
		std::unique_lock<std::mutex> lock(mutex);
		cond.wait(lock, [this]{
			return stop || chunks.size() < PIPE_CHUNKS;
		});

		if (stop)
			return false;

		was_empty = chunks.empty();
		chunks.push_back(std::move(chunk));
		delivered = true;
		client_cond.notify_one();
	}

	if (was_empty)
		listener.OnSourceData();

	return true;
}

void
Source::RunThread() noexcept
{
	std::exception_ptr decode_error;

	try {
		SourceBuilder builder(*this);
		plugin.FileDecode(builder, file);
		builder.Flush();
	} catch (...) {
		decode_error = std::current_exception();
	}

	bool log_error = false;

	{
		const std::scoped_lock<std::mutex> lock(mutex);

		if (decode_error && !stop) {
			if (delivered)
				/* playback has already started; end
				   the stream here */
				log_error = true;
			else
				error = decode_error;
		}

		finished = true;
		client_cond.notify_one();
	}

	if (log_error)
		FmtWarning(decoder_domain, "Failed to decode \"{}\": {}{}",
			   path, error_prefix, GetFullMessage(decode_error));

	listener.OnSourceData();
}
