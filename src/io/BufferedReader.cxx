// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "BufferedReader.hxx"
#include "Reader.hxx"

#include <algorithm>
#include <stdexcept>

bool
BufferedReader::Fill()
{
	if (eof)
		return false;

	/* move the unconsumed rest to the front */
	buffer.erase(buffer.begin(), buffer.begin() + position);
	position = 0;

	if (buffer.size() >= MAX_LINE_LENGTH)
		throw std::runtime_error("Line is too long");

	const std::size_t old_size = buffer.size();
	buffer.resize(old_size + 16384);

	const std::size_t nbytes =
		reader.Read(std::as_writable_bytes(std::span{buffer}.subspan(old_size)));
	buffer.resize(old_size + nbytes);

	if (nbytes == 0)
		eof = true;

	return nbytes > 0;
}

char *
BufferedReader::ReadLine()
{
	std::size_t scanned = 0;

	while (true) {
		const auto begin = buffer.begin() + position;
		const auto newline = std::find(begin + scanned, buffer.end(), '\n');
		if (newline != buffer.end()) {
			*newline = 0;
			if (newline != begin && newline[-1] == '\r')
				newline[-1] = 0;

			char *line = &*begin;
			position = std::distance(buffer.begin(), newline) + 1;
			++line_number;
			return line;
		}

		scanned = std::distance(begin, buffer.end());

		if (!Fill()) {
			if (position == buffer.size())
				return nullptr;

			/* the last line has no line terminator */
			buffer.push_back(0);
			char *line = &buffer[position];
			position = buffer.size();
			++line_number;
			return line;
		}
	}
}
