// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef VPLAY_DECODER_SNDFILE_HXX
#define VPLAY_DECODER_SNDFILE_HXX

extern const struct DecoderPlugin sndfile_decoder_plugin;

#endif
