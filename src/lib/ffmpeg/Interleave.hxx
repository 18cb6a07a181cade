// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include <cstddef>
#include <span>
#include <vector>

struct AVFrame;

namespace Ffmpeg {

/**
 * Return the interleaved PCM data of the given #AVFrame.  Planar
 * frames are interleaved into the given buffer; for packed frames,
 * the frame's own data is returned.
 *
 * Throws on error.
 */
std::span<const std::byte>
InterleaveFrame(const AVFrame &frame, std::vector<std::byte> &buffer);

} // namespace Ffmpeg
