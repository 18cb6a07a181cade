// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

extern "C" {
#include <libavformat/avio.h>
}

#include <cstddef>
#include <cstdint>
#include <span>

class FileReader;

/**
 * An #AVIOContext which reads from a #FileReader.
 */
struct AvioStream {
	FileReader &file;

	AVIOContext *io = nullptr;

	explicit AvioStream(FileReader &_file) noexcept
		:file(_file) {}

	~AvioStream() noexcept;

	AvioStream(const AvioStream &) = delete;
	AvioStream &operator=(const AvioStream &) = delete;

	/**
	 * Throws on error.
	 */
	void Open();

private:
	int Read(std::span<std::byte> dest) noexcept;
	int64_t Seek(int64_t pos, int whence) noexcept;

	static int _Read(void *opaque, uint8_t *buf, int size) noexcept;
	static int64_t _Seek(void *opaque, int64_t pos, int whence) noexcept;
};
