// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef VPLAY_DECODER_FLAC_HXX
#define VPLAY_DECODER_FLAC_HXX

extern const struct DecoderPlugin flac_decoder_plugin;

#endif
