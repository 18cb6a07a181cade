// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef VPLAY_PLAYER_ERROR_HXX
#define VPLAY_PLAYER_ERROR_HXX

#include <cstdint>
#include <stdexcept>
#include <string>

enum class AudioErrorCode : uint8_t {
	/**
	 * The file type is rejected without looking at the file.
	 */
	UNSUPPORTED_FORMAT,

	/**
	 * The decoder failed to parse the file.
	 */
	DECODE,

	/**
	 * The file does not exist.
	 */
	NOT_FOUND,

	/**
	 * Any other failure to access the file.
	 */
	IO,

	/**
	 * The player thread has exited.
	 */
	ENGINE_UNAVAILABLE,

	/**
	 * The player thread did not respond in time.
	 */
	TIMEOUT,
};

/**
 * Returns a lower-case identifier, e.g. "not_found".
 */
[[gnu::const]]
const char *
ToString(AudioErrorCode code) noexcept;

/**
 * An error which is reported to the caller of a #PlayerHandle
 * method.
 */
class AudioError : public std::runtime_error {
	AudioErrorCode code;

public:
	AudioError(AudioErrorCode _code, const char *_msg)
		:std::runtime_error(_msg), code(_code) {}

	AudioError(AudioErrorCode _code, const std::string &_msg)
		:std::runtime_error(_msg), code(_code) {}

	AudioErrorCode GetCode() const noexcept {
		return code;
	}

	static AudioError UnsupportedFormat() {
		return {AudioErrorCode::UNSUPPORTED_FORMAT,
			"M4A/AAC not supported. Use MP3, WAV, FLAC, or OGG."};
	}

	static AudioError NotFound() {
		return {AudioErrorCode::NOT_FOUND, "File not found."};
	}

	static AudioError EngineUnavailable() {
		return {AudioErrorCode::ENGINE_UNAVAILABLE,
			"Audio engine unavailable."};
	}

	static AudioError Timeout() {
		return {AudioErrorCode::TIMEOUT, "Playback start timed out."};
	}
};

#endif
