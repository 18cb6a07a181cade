// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef VPLAY_PLAYER_DOMAIN_HXX
#define VPLAY_PLAYER_DOMAIN_HXX

extern const class Domain player_domain;

#endif
