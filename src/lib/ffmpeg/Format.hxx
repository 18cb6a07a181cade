// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include "Error.hxx"

extern "C" {
#include <libavformat/avformat.h>
}

#include <new>
#include <utility>

namespace Ffmpeg {

/**
 * OO wrapper for an input #AVFormatContext.
 */
class FormatContext {
	AVFormatContext *context = nullptr;

public:
	FormatContext() = default;

	/**
	 * Open an input which reads from the given #AVIOContext.
	 *
	 * Throws on error.
	 */
	explicit FormatContext(AVIOContext *pb) {
		context = avformat_alloc_context();
		if (context == nullptr)
			throw std::bad_alloc();

		context->pb = pb;

		int err = avformat_open_input(&context, "", nullptr, nullptr);
		if (err < 0)
			/* avformat_open_input() has freed the
			   context */
			throw MakeFfmpegError(err, "avformat_open_input() failed");
	}

	FormatContext(FormatContext &&src) noexcept
		:context(std::exchange(src.context, nullptr)) {}

	~FormatContext() noexcept {
		if (context != nullptr)
			avformat_close_input(&context);
	}

	FormatContext &operator=(FormatContext &&src) noexcept {
		using std::swap;
		swap(context, src.context);
		return *this;
	}

	AVFormatContext &operator*() noexcept {
		return *context;
	}

	AVFormatContext *operator->() noexcept {
		return context;
	}

	/**
	 * Throws on error.
	 */
	void FindStreamInfo() {
		int err = avformat_find_stream_info(context, nullptr);
		if (err < 0)
			throw MakeFfmpegError(err, "avformat_find_stream_info() failed");
	}
};

} // namespace Ffmpeg
