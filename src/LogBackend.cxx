// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "LogBackend.hxx"
#include "Log.hxx"
#include "lib/fmt/ExceptionFormatter.hxx"
#include "util/Domain.hxx"
#include "util/StringStrip.hxx"

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <atomic>
#include <iterator> // for std::back_inserter()

#include <stdio.h>
#include <time.h>

using std::string_view_literals::operator""sv;

static std::atomic<LogLevel> log_threshold{LogLevel::NOTICE};

static bool enable_timestamp;

static constexpr Domain exception_domain("exception");

void
SetLogThreshold(LogLevel _threshold) noexcept
{
	log_threshold.store(_threshold, std::memory_order_relaxed);
}

LogLevel
GetLogThreshold() noexcept
{
	return log_threshold.load(std::memory_order_relaxed);
}

void
EnableLogTimestamp() noexcept
{
	enable_timestamp = true;
}

std::string_view
log_date() noexcept
{
	static constexpr size_t LOG_DATE_BUF_SIZE = std::char_traits<char>::length("Jan 22 15:43:14 : ") + 1;
	thread_local char buf[LOG_DATE_BUF_SIZE];

	time_t t = time(nullptr);
	struct tm tm;
	if (localtime_r(&t, &tm) == nullptr)
		return {};

	const auto result = fmt::format_to_n(buf, sizeof(buf) - 1,
					     "{:%b %d %H:%M:%S} : ", tm);
	return {buf, result.size < sizeof(buf) ? result.size : sizeof(buf) - 1};
}

static void
FileLog(const Domain &domain, std::string_view message) noexcept
{
	fmt::print(stderr, "{}{}: {}\n",
		   enable_timestamp ? log_date() : ""sv,
		   domain.GetName(),
		   StripRight(message));
}

void
Log(LogLevel level, const Domain &domain, std::string_view msg) noexcept
{
	if (level < GetLogThreshold())
		return;

	FileLog(domain, msg);
}

void
LogVFmt(LogLevel level, const Domain &domain,
	fmt::string_view format_str, fmt::format_args args) noexcept
{
	if (level < GetLogThreshold())
		return;

	fmt::memory_buffer buffer;
	fmt::vformat_to(std::back_inserter(buffer), format_str, args);
	FileLog(domain, {buffer.data(), buffer.size()});
}

void
Log(LogLevel level, const std::exception_ptr &ep) noexcept
{
	LogFmt(level, exception_domain, "{}", ep);
}

void
Log(LogLevel level, const std::exception_ptr &ep, const char *msg) noexcept
{
	LogFmt(level, exception_domain, "{}: {}", msg, ep);
}
