// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include "Error.hxx"

extern "C" {
#include <libavcodec/avcodec.h>
}

#include <new>

namespace Ffmpeg {

/**
 * OO wrapper for an #AVCodecContext.
 */
class CodecContext {
	AVCodecContext *codec_context;

public:
	/**
	 * Throws on error.
	 */
	explicit CodecContext(const AVCodec &codec)
		:codec_context(avcodec_alloc_context3(&codec))
	{
		if (codec_context == nullptr)
			throw std::bad_alloc();
	}

	~CodecContext() noexcept {
		avcodec_free_context(&codec_context);
	}

	CodecContext(const CodecContext &) = delete;
	CodecContext &operator=(const CodecContext &) = delete;

	AVCodecContext &operator*() noexcept {
		return *codec_context;
	}

	AVCodecContext *operator->() noexcept {
		return codec_context;
	}

	/**
	 * Throws on error.
	 */
	void FillFromParameters(const AVCodecParameters &par) {
		int err = avcodec_parameters_to_context(codec_context, &par);
		if (err < 0)
			throw MakeFfmpegError(err, "avcodec_parameters_to_context() failed");
	}

	/**
	 * Throws on error.
	 */
	void Open(const AVCodec &codec) {
		int err = avcodec_open2(codec_context, &codec, nullptr);
		if (err < 0)
			throw MakeFfmpegError(err, "avcodec_open2() failed");
	}
};

} // namespace Ffmpeg
