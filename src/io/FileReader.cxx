// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "FileReader.hxx"
#include "lib/fmt/SystemError.hxx"

#include <cassert>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

FileReader::FileReader(const char *path)
	:fd(open(path, O_RDONLY|O_NOCTTY|O_CLOEXEC))
{
	if (fd < 0)
		throw FmtErrno("Failed to open \"{}\"", path);
}

FileReader::~FileReader() noexcept
{
	if (fd >= 0)
		close(fd);
}

uint_least64_t
FileReader::GetSize() const noexcept
{
	struct stat st;
	return fstat(fd, &st) == 0
		? uint_least64_t(st.st_size)
		: 0;
}

uint_least64_t
FileReader::GetPosition() const noexcept
{
	const off_t position = lseek(fd, 0, SEEK_CUR);
	return position >= 0
		? uint_least64_t(position)
		: 0;
}

std::size_t
FileReader::Read(std::span<std::byte> dest)
{
	assert(fd >= 0);

	ssize_t nbytes = read(fd, dest.data(), dest.size());
	if (nbytes < 0)
		throw MakeErrno("Failed to read from file");

	return nbytes;
}

void
FileReader::Seek(off_t offset)
{
	assert(fd >= 0);

	if (lseek(fd, offset, SEEK_SET) < 0)
		throw MakeErrno("Failed to seek");
}

void
FileReader::Skip(off_t offset)
{
	assert(fd >= 0);

	if (lseek(fd, offset, SEEK_CUR) < 0)
		throw MakeErrno("Failed to seek");
}
