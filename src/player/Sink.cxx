// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Sink.hxx"

#include <cassert>

void
Sink::Append(std::unique_ptr<Source> source) noexcept
{
	if (source->IsDrained())
		return;

	sources.push_back(std::move(source));
}

std::span<const float>
Sink::Read(std::size_t max_bytes) noexcept
{
	while (!sources.empty()) {
		auto &source = *sources.front();

		const auto result = source.Read(max_bytes);
		if (!result.empty() || !source.IsDrained())
			return result;

		sources.pop_front();
	}

	return {};
}

void
Sink::Consume(std::size_t n_samples) noexcept
{
	assert(!sources.empty());

	sources.front()->Consume(n_samples);
}

void
Sink::Clear() noexcept
{
	sources.clear();
}

PlayerStatus
Sink::GetStatus() const noexcept
{
	PlayerStatus status;
	status.state = GetState();
	status.paused = paused;
	status.queued = static_cast<unsigned>(sources.size());

	if (const auto *current = GetCurrent()) {
		status.path = current->GetPath();
		status.audio_format = current->GetAudioFormat();
	}

	return status;
}
