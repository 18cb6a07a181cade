// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef VPLAY_DECODER_DOMAIN_HXX
#define VPLAY_DECODER_DOMAIN_HXX

extern const class Domain decoder_domain;

#endif
