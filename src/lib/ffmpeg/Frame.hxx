// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

extern "C" {
#include <libavutil/frame.h>
}

#include <new>

namespace Ffmpeg {

/**
 * OO wrapper for an #AVFrame.
 */
class Frame {
	AVFrame *frame;

public:
	/**
	 * Throws on error.
	 */
	Frame():frame(av_frame_alloc()) {
		if (frame == nullptr)
			throw std::bad_alloc();
	}

	~Frame() noexcept {
		av_frame_free(&frame);
	}

	Frame(const Frame &) = delete;
	Frame &operator=(const Frame &) = delete;

	AVFrame &operator*() noexcept {
		return *frame;
	}

	AVFrame *operator->() noexcept {
		return frame;
	}

	AVFrame *get() noexcept {
		return frame;
	}

	void Unref() noexcept {
		av_frame_unref(frame);
	}
};

} // namespace Ffmpeg
