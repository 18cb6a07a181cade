// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef VPLAY_PLAYER_SOURCE_HXX
#define VPLAY_PLAYER_SOURCE_HXX

#include "pcm/AudioFormat.hxx"
#include "io/FileReader.hxx"
#include "thread/Thread.hxx"

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <mutex>
#include <span>
#include <string>
#include <vector>

struct DecoderPlugin;

/**
 * Receives notifications from the decoder thread of a #Source.
 */
class SourceListener {
public:
	/**
	 * The pipe of a #Source is no longer empty, or its decoder
	 * has finished.  Called from the decoder thread.
	 */
	virtual void OnSourceData() noexcept = 0;
};

/**
 * One file being played.  A decoder thread runs the
 * #DecoderPlugin and fills a bounded pipe of chunks of 32 bit float
 * samples; the player thread reads from the head of the pipe.
 * Destroying the object stops the decoder.
 */
class Source {
	friend class SourceBuilder;

public:
	/**
	 * The number of frames in one chunk.
	 */
	static constexpr std::size_t CHUNK_FRAMES = 1024;

	/**
	 * The capacity of the pipe.  The decoder thread waits while
	 * it is full.
	 */
	static constexpr std::size_t PIPE_CHUNKS = 128;

private:
	const std::string path;

	const DecoderPlugin &plugin;

	/**
	 * Prepended to decoder error messages.
	 */
	const char *const error_prefix;

	FileReader file;

	SourceListener &listener;

	Thread thread;

	/**
	 * Protects all attributes below except #position.
	 */
	mutable std::mutex mutex;

	/**
	 * Wakes up the decoder thread when a chunk has been consumed
	 * or when #stop has been set.
	 */
	std::condition_variable cond;

	/**
	 * Wakes up Start().
	 */
	std::condition_variable client_cond;

	/**
	 * The format of the chunks; its sample format is always
	 * SampleFormat::FLOAT.  Undefined until the plugin has
	 * parsed the stream headers.
	 */
	AudioFormat audio_format = AudioFormat::Undefined();

	std::deque<std::vector<float>> chunks;

	/**
	 * The error thrown by the plugin before it delivered the
	 * first chunk.  Later errors end the stream and are only
	 * logged.
	 */
	std::exception_ptr error;

	/**
	 * Has at least one chunk been pushed?
	 */
	bool delivered = false;

	/**
	 * Has the decoder thread returned from the plugin?
	 */
	bool finished = false;

	/**
	 * Shall the decoder thread quit?
	 */
	bool stop = false;

	/**
	 * The number of samples of the first chunk which have been
	 * consumed.  Only used by the player thread.
	 */
	std::size_t position = 0;

public:
	/**
	 * @param _file the opened file; it is read by the decoder
	 * thread
	 */
	Source(std::string _path, const DecoderPlugin &_plugin,
	       const char *_error_prefix, FileReader &&_file,
	       SourceListener &_listener) noexcept;

	~Source() noexcept;

	Source(const Source &) = delete;
	Source &operator=(const Source &) = delete;

	const std::string &GetPath() const noexcept {
		return path;
	}

	/**
	 * Only valid after Start() has returned.
	 */
	const AudioFormat &GetAudioFormat() const noexcept {
		return audio_format;
	}

	/**
	 * Start the decoder thread and wait until it has delivered
	 * the first chunk or has finished.
	 *
	 * Throws #AudioError (DECODE) if the plugin failed or did not
	 * find an audio stream.
	 */
	void Start();

	/**
	 * Has the decoder finished and has all of its audio been
	 * consumed?
	 */
	[[gnu::pure]]
	bool IsDrained() const noexcept;

	/**
	 * Is there a chunk to be read, or has the stream ended?  If
	 * not, the decoder has not caught up yet, and the
	 * #SourceListener will be notified.
	 */
	[[gnu::pure]]
	bool IsReadable() const noexcept;

	/**
	 * Returns up to #max_bytes (but at least one frame) of the
	 * first chunk which have not been consumed yet.  The span is
	 * empty if the pipe is empty.
	 */
	std::span<const float> Read(std::size_t max_bytes) noexcept;

	/**
	 * Mark samples returned by Read() as played.
	 */
	void Consume(std::size_t n_samples) noexcept;

private:
	void RunThread() noexcept;

	/* the following methods are called by SourceBuilder in the
	   decoder thread */

	void SetAudioFormat(AudioFormat _audio_format) noexcept;

	/**
	 * Append a chunk to the pipe, waiting while it is full.
	 *
	 * @return false if the decoder shall stop
	 */
	bool Push(std::vector<float> &&chunk);
};

#endif
