// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef VPLAY_DECODER_VORBIS_HXX
#define VPLAY_DECODER_VORBIS_HXX

extern const struct DecoderPlugin vorbis_decoder_plugin;

#endif
