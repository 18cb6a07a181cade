// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include "Reader.hxx"

#include <cstdint>
#include <utility> // for std::exchange()

#include <sys/types.h> // for off_t

/**
 * A regular file opened for reading.  The descriptor is closed by the
 * destructor.
 */
class FileReader final : public Reader {
	int fd;

public:
	/**
	 * Throws #std::system_error on error.
	 */
	explicit FileReader(const char *path);

	FileReader(FileReader &&other) noexcept
		:fd(std::exchange(other.fd, -1)) {}

	~FileReader() noexcept override;

	FileReader &operator=(FileReader &&) = delete;

	int GetFD() const noexcept {
		return fd;
	}

	[[gnu::pure]]
	uint_least64_t GetSize() const noexcept;

	[[gnu::pure]]
	uint_least64_t GetPosition() const noexcept;

	void Rewind() {
		Seek(0);
	}

	void Seek(off_t offset);
	void Skip(off_t offset);

	/* virtual methods from class Reader */
	std::size_t Read(std::span<std::byte> dest) override;
};
