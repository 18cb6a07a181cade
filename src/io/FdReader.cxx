// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "FdReader.hxx"
#include "system/Error.hxx"

#include <unistd.h>

std::size_t
FdReader::Read(std::span<std::byte> dest)
{
	while (true) {
		ssize_t nbytes = read(fd, dest.data(), dest.size());
		if (nbytes >= 0)
			return nbytes;

		if (errno != EINTR)
			throw MakeErrno("Failed to read");
	}
}
