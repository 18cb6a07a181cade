// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "LogInit.hxx"
#include "LogBackend.hxx"
#include "Log.hxx"
#include "config/Data.hxx"
#include "config/Option.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "lib/fmt/SystemError.hxx"
#include "util/Domain.hxx"

#include <fcntl.h>
#include <stdio.h>
#include <string.h>
#include <unistd.h>

static constexpr Domain log_domain("log");

/**
 * Redirect stderr to the given log file.
 */
static void
log_init_file(const char *path, int line)
{
	int fd = open(path, O_CREAT|O_WRONLY|O_APPEND|O_CLOEXEC, 0666);
	if (fd < 0)
		throw FmtErrno("failed to open log file \"{}\" (config line {})",
			       path, line);

	fflush(stderr);

	if (dup2(fd, STDERR_FILENO) < 0) {
		const int e = errno;
		close(fd);
		throw MakeErrno(e, "Failed to dup2 stderr");
	}

	close(fd);

	EnableLogTimestamp();
}

static LogLevel
parse_log_level(const char *value)
{
	if (strcmp(value, "notice") == 0)
		return LogLevel::NOTICE;
	else if (strcmp(value, "info") == 0)
		return LogLevel::INFO;
	else if (strcmp(value, "verbose") == 0)
		return LogLevel::DEBUG;
	else if (strcmp(value, "warning") == 0)
		return LogLevel::WARNING;
	else if (strcmp(value, "error") == 0)
		return LogLevel::ERROR;
	else
		throw FmtRuntimeError("unknown log level \"{}\"", value);
}

void
log_early_init(bool verbose) noexcept
{
	/* force stderr to be line-buffered */
	setvbuf(stderr, nullptr, _IOLBF, 0);

	if (verbose)
		SetLogThreshold(LogLevel::DEBUG);
}

void
log_init(const ConfigData &config, bool verbose, bool use_stderr)
{
	if (verbose)
		SetLogThreshold(LogLevel::DEBUG);
	else
		SetLogThreshold(config.With(ConfigOption::LOG_LEVEL, [](const char *s){
			return s != nullptr
				? parse_log_level(s)
				: LogLevel::NOTICE;
		}));

	if (use_stderr)
		return;

	const auto *param = config.GetParam(ConfigOption::LOG_FILE);
	if (param == nullptr)
		return;

	const auto path = param->GetPath();
	log_init_file(path.c_str(), param->line);
	FmtDebug(log_domain, "logging to {}", path);
}

void
log_deinit() noexcept
{
	fflush(stderr);
}
