// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef VPLAY_DECODER_MPG123_HXX
#define VPLAY_DECODER_MPG123_HXX

extern const struct DecoderPlugin mpg123_decoder_plugin;

#endif
