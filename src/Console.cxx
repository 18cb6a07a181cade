// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Console.hxx"
#include "player/Handle.hxx"
#include "player/Status.hxx"
#include "player/Error.hxx"
#include "pcm/AudioFormat.hxx"
#include "io/BufferedReader.hxx"
#include "util/CharUtil.hxx"
#include "util/StringBuffer.hxx"
#include "util/StringCompare.hxx"
#include "util/StringStrip.hxx"
#include "util/Tokenizer.hxx"
#include "util/Domain.hxx"
#include "Log.hxx"

#include <fmt/format.h>

#include <iterator>
#include <stdexcept>

static constexpr Domain console_domain("console");

static void
WriteError(std::string &response, const AudioError &e)
{
	fmt::format_to(std::back_inserter(response), "ACK [{}] {}\n",
		       ToString(e.GetCode()), e.what());
}

static void
WriteUnknownCommand(std::string &response, const char *line)
{
	fmt::format_to(std::back_inserter(response),
		       "ACK [unknown] unknown command \"{}\"\n", line);
}

/**
 * Parse the argument of "play": either a quoted string or the rest
 * of the line.
 *
 * @return the path or nullptr if it is missing
 */
static const char *
ParsePlayPath(char *args)
{
	if (*args == '"') {
		Tokenizer tokenizer(args);
		const char *path = tokenizer.NextString();
		if (!tokenizer.IsEnd())
			throw std::runtime_error("Garbage after the path");

		return path;
	}

	StripRight(args);
	return *args != 0 ? args : nullptr;
}

inline void
ConsoleSession::HandlePlay(char *args, std::string &response)
{
	const char *path;

	try {
		path = ParsePlayPath(args);
	} catch (const std::runtime_error &e) {
		fmt::format_to(std::back_inserter(response),
			       "ACK [arg] {}\n", e.what());
		return;
	}

	if (path == nullptr || StringIsEmpty(path)) {
		response += "ACK [arg] missing path\n";
		return;
	}

	FmtDebug(console_domain, "play \"{}\"", path);

	try {
		player.Play(path);
	} catch (const AudioError &e) {
		WriteError(response, e);
		return;
	}

	response += "OK\n";
}

inline void
ConsoleSession::HandleSimple(void (PlayerHandle::*method)(),
			     std::string &response)
{
	try {
		(player.*method)();
	} catch (const AudioError &e) {
		WriteError(response, e);
		return;
	}

	response += "OK\n";
}

inline void
ConsoleSession::HandleStatus(std::string &response)
{
	PlayerStatus status;

	try {
		status = player.GetStatus();
	} catch (const AudioError &e) {
		WriteError(response, e);
		return;
	}

	auto out = std::back_inserter(response);
	fmt::format_to(out, "state: {}\n", ToString(status.state));

	if (!status.path.empty())
		fmt::format_to(out, "file: {}\n", status.path);

	if (status.audio_format.IsDefined())
		fmt::format_to(out, "format: {}\n",
			       ToString(status.audio_format).c_str());

	fmt::format_to(out, "queued: {}\n"
		       "paused: {}\n"
		       "OK\n",
		       status.queued, unsigned(status.paused));
}

ConsoleSession::Result
ConsoleSession::HandleLine(char *line, std::string &response)
{
	line = StripLeft(line);
	if (*line == 0)
		return Result::CONTINUE;

	/* split off the command name */
	char *args = line;
	while (*args != 0 && !IsWhitespaceOrNull(*args))
		++args;

	if (*args != 0) {
		*args = 0;
		args = StripLeft(args + 1);
	}

	const char *command = line;

	if (StringIsEqual(command, "play")) {
		HandlePlay(args, response);
	} else if (StringIsEqual(command, "status")) {
		HandleStatus(response);
	} else if (StringIsEqual(command, "stop")) {
		HandleSimple(&PlayerHandle::Stop, response);
	} else if (StringIsEqual(command, "pause")) {
		HandleSimple(&PlayerHandle::PauseOrResume, response);
	} else if (StringIsEqual(command, "quit") ||
		   StringIsEqual(command, "close")) {
		return Result::CLOSE;
	} else {
		WriteUnknownCommand(response, command);
	}

	return Result::CONTINUE;
}

void
RunConsole(Reader &input, FILE *output, PlayerHandle &player)
{
	BufferedReader reader(input);
	ConsoleSession session(player);
	std::string response;

	while (char *line = reader.ReadLine()) {
		response.clear();
		const auto result = session.HandleLine(line, response);

		if (!response.empty()) {
			fwrite(response.data(), 1, response.size(), output);
			fflush(output);
		}

		if (result == ConsoleSession::Result::CLOSE)
			break;
	}

	LogDebug(console_domain, "end of session");
}
