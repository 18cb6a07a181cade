// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Timer.hxx"
#include "pcm/AudioFormat.hxx"

#include <cassert>
#include <cstdint>

Timer::Timer(const AudioFormat af) noexcept
	:rate(af.sample_rate * af.GetFrameSize())
{
}

void
Timer::Start() noexcept
{
	end = Clock::now();
	started = true;
}

void
Timer::Reset() noexcept
{
	started = false;
}

void
Timer::Add(std::size_t size) noexcept
{
	assert(started);

	using std::chrono::microseconds;
	end += microseconds(uint64_t(size) * microseconds::period::den / rate);
}

Timer::Clock::duration
Timer::GetDelay() const noexcept
{
	assert(started);

	const auto delay = end - Clock::now();
	if (delay < Clock::duration::zero())
		return Clock::duration::zero();

	return delay;
}
