// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef VPLAY_AUDIO_OUTPUT_INTERFACE_HXX
#define VPLAY_AUDIO_OUTPUT_INTERFACE_HXX

#include <chrono>
#include <cstddef>
#include <span>

struct AudioFormat;

/**
 * An opened audio device.  All methods are called from the player
 * thread.
 */
class AudioOutput {
public:
	AudioOutput() noexcept = default;
	virtual ~AudioOutput() noexcept = default;

	AudioOutput(const AudioOutput &) = delete;
	AudioOutput &operator=(const AudioOutput &) = delete;

	/**
	 * Enable the device.  This may allocate resources, preparing
	 * for the device to be opened.
	 *
	 * Throws on error.
	 */
	virtual void Enable() {}

	/**
	 * Disables the device.  It is closed before this method is
	 * called.
	 */
	virtual void Disable() noexcept {}

	/**
	 * Really open the device.
	 *
	 * Throws on error.
	 *
	 * @param audio_format the audio format in which data is going
	 * to be delivered; may be modified by the plugin
	 */
	virtual void Open(AudioFormat &audio_format) = 0;

	/**
	 * Close the device.
	 */
	virtual void Close() noexcept = 0;

	/**
	 * Returns a positive number if the output thread shall further
	 * delay the next call to Play() or Pause(), which will happen
	 * until this function returns 0.  This should be implemented
	 * instead of doing a sleep inside the plugin, because this
	 * allows the caller to listen to commands meanwhile.
	 *
	 * @return the duration to wait
	 */
	virtual std::chrono::steady_clock::duration Delay() const noexcept {
		return std::chrono::steady_clock::duration::zero();
	}

	/**
	 * Play a chunk of audio data.  The method blocks until at
	 * least one audio frame is consumed.
	 *
	 * Throws on error.
	 *
	 * @return the number of bytes played (must be a multiple of
	 * the frame size)
	 */
	virtual std::size_t Play(std::span<const std::byte> src) = 0;

	/**
	 * Let the device play the data which has been passed to
	 * Play().  This method does not block; if it returns false,
	 * the caller waits for Delay() and calls it again.
	 *
	 * Throws on error.
	 *
	 * @return true when the device has finished playing
	 */
	virtual bool Drain() {
		return true;
	}

	/**
	 * Try to cancel data which may still be in the device's
	 * buffers.
	 */
	virtual void Cancel() noexcept {}

	/**
	 * Pause the device.  It stays open, but does not play
	 * anything; the next Play() call resumes playback.  Plugins
	 * which do not support pausing will simply be closed, and
	 * have to be reopened when unpaused.
	 *
	 * Throws on error.
	 *
	 * @return false on error (output will be closed by caller),
	 * true for continue to pause
	 */
	virtual bool Pause() {
		/* fail because this method is not implemented */
		return false;
	}
};

#endif
