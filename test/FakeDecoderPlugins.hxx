// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef VPLAY_TEST_FAKE_DECODER_PLUGINS_HXX
#define VPLAY_TEST_FAKE_DECODER_PLUGINS_HXX

#include <atomic>
#include <cstdint>
#include <string_view>
#include <vector>

struct DecoderPlugin;

/*
 * Decoder plugins which replace the real ones by name ("mpg123",
 * "sndfile", "flac", "vorbis", "ffmpeg").  They don't parse the
 * file; its contents select the behavior:
 *
 * - "error": throw an exception
 * - "silent": return without announcing an audio format
 * - "slow": sleep for #FAKE_SLOW_DELAY_MS before announcing the format,
 *   then continue like the next case
 * - anything else: 44.1 kHz stereo, as many seconds as the sum of
 *   the digits '0'..'9' in the file (e.g. "5" is five seconds,
 *   "99" eighteen); each plugin submits a different sample format
 *
 * The plugins stop when SubmitAudio() returns
 * DecoderCommand::STOP.
 */

extern const DecoderPlugin fake_mpg123_plugin;
extern const DecoderPlugin fake_sndfile_plugin;
extern const DecoderPlugin fake_flac_plugin;
extern const DecoderPlugin fake_vorbis_plugin;
extern const DecoderPlugin fake_ffmpeg_plugin;

/**
 * Returns all fake plugins except the one with the given name.
 */
std::vector<const DecoderPlugin *>
GetFakeDecoderPlugins(std::string_view except={});

/**
 * The sample value submitted by all fake plugins, after conversion
 * to float.
 */
static constexpr float FAKE_SAMPLE_VALUE = 0.5f;

static constexpr unsigned FAKE_SAMPLE_RATE = 44100;
static constexpr unsigned FAKE_CHANNELS = 2;

static constexpr unsigned FAKE_SLOW_DELAY_MS = 500;

/**
 * The total number of frames submitted by all fake plugins.
 */
extern std::atomic<uint64_t> fake_submitted_frames;

#endif
