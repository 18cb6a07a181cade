// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include <cstddef>
#include <vector>

class Reader;

/**
 * Reads a #Reader line by line.
 */
class BufferedReader {
	static constexpr std::size_t MAX_LINE_LENGTH = 64 * 1024;

	Reader &reader;

	std::vector<char> buffer;

	/**
	 * The start of unconsumed data in #buffer.
	 */
	std::size_t position = 0;

	bool eof = false;

	unsigned line_number = 0;

public:
	explicit BufferedReader(Reader &_reader) noexcept
		:reader(_reader) {}

	/**
	 * Read the next line.  The line terminator is removed.
	 *
	 * Throws on I/O error or if a line is too long.
	 *
	 * @return the null-terminated line, or nullptr at the end of
	 * the stream; the pointer is valid until the next call
	 */
	char *ReadLine();

	unsigned GetLineNumber() const noexcept {
		return line_number;
	}

private:
	/**
	 * @return false on end of stream
	 */
	bool Fill();
};
