// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef VPLAY_CONSOLE_HXX
#define VPLAY_CONSOLE_HXX

#include <string>

#include <stdio.h>

class PlayerHandle;
class Reader;

/**
 * Translates request lines into #PlayerHandle calls.  Replies use
 * the MPD protocol syntax: "OK" or "ACK [code] message".
 */
class ConsoleSession {
	PlayerHandle &player;

public:
	enum class Result {
		CONTINUE,

		/**
		 * The client has requested to end the session.
		 */
		CLOSE,
	};

	explicit ConsoleSession(PlayerHandle &_player) noexcept
		:player(_player) {}

	/**
	 * Handle one request line and append the reply to
	 * #response.  The line is modified.
	 *
	 * Throws on fatal errors; failed requests are reported in
	 * #response.
	 */
	Result HandleLine(char *line, std::string &response);

private:
	void HandlePlay(char *args, std::string &response);
	void HandleSimple(void (PlayerHandle::*method)(),
			  std::string &response);
	void HandleStatus(std::string &response);
};

/**
 * Read requests from #input until end of stream or "quit", and write
 * the replies to #output.
 *
 * Throws on I/O error.
 */
void
RunConsole(Reader &input, FILE *output, PlayerHandle &player);

#endif
