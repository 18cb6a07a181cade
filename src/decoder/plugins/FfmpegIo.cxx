// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "FfmpegIo.hxx"
#include "io/FileReader.hxx"
#include "Log.hxx"

extern "C" {
#include <libavutil/error.h>
#include <libavutil/mem.h>
}

#include <exception>
#include <new>

#include <stdio.h>

AvioStream::~AvioStream() noexcept
{
	if (io != nullptr) {
		av_free(io->buffer);
		avio_context_free(&io);
	}
}

inline int
AvioStream::Read(std::span<std::byte> dest) noexcept
{
	try {
		const auto nbytes = file.Read(dest);
		if (nbytes == 0)
			return AVERROR_EOF;

		return nbytes;
	} catch (...) {
		LogError(std::current_exception(), "Read failed");
		return AVERROR(EIO);
	}
}

inline int64_t
AvioStream::Seek(int64_t pos, int whence) noexcept
{
	switch (whence) {
	case SEEK_SET:
		break;

	case SEEK_CUR:
		pos += file.GetPosition();
		break;

	case SEEK_END:
		pos += file.GetSize();
		break;

	case AVSEEK_SIZE:
		return file.GetSize();

	default:
		return -1;
	}

	try {
		file.Seek(pos);
		return file.GetPosition();
	} catch (...) {
		LogError(std::current_exception(), "Seek failed");
		return -1;
	}
}

int
AvioStream::_Read(void *opaque, uint8_t *buf, int size) noexcept
{
	AvioStream &stream = *(AvioStream *)opaque;

	return stream.Read({(std::byte *)buf, std::size_t(size)});
}

int64_t
AvioStream::_Seek(void *opaque, int64_t pos, int whence) noexcept
{
	AvioStream &stream = *(AvioStream *)opaque;

	return stream.Seek(pos, whence);
}

void
AvioStream::Open()
{
	constexpr size_t BUFFER_SIZE = 8192;
	auto buffer = (unsigned char *)av_malloc(BUFFER_SIZE);
	if (buffer == nullptr)
		throw std::bad_alloc();

	io = avio_alloc_context(buffer, BUFFER_SIZE,
				false, this,
				_Read, nullptr,
				_Seek);
	if (io == nullptr) {
		av_free(buffer);
		throw std::bad_alloc();
	}
}
