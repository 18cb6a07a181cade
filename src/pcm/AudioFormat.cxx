// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "AudioFormat.hxx"
#include "util/StringBuffer.hxx"

#include <fmt/format.h>

StringBuffer<24>
ToString(const AudioFormat af) noexcept
{
	StringBuffer<24> buffer;
	char *p = buffer.data();
	char *const end = p + buffer.capacity() - 1;

	const char *sample_format = af.format != SampleFormat::UNDEFINED
		? sample_format_to_string(af.format)
		: "*";

	if (af.sample_rate > 0)
		p = fmt::format_to_n(p, end - p, "{}:{}:",
				     af.sample_rate, sample_format).out;
	else
		p = fmt::format_to_n(p, end - p, "*:{}:", sample_format).out;

	if (af.channels > 0)
		p = fmt::format_to_n(p, end - p, "{}", unsigned(af.channels)).out;
	else if (p < end)
		*p++ = '*';

	*p = 0;
	return buffer;
}
