// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include "Reader.hxx"

/**
 * A #Reader which reads from a file descriptor it does not own,
 * e.g. standard input.
 */
class FdReader final : public Reader {
	const int fd;

public:
	explicit constexpr FdReader(int _fd) noexcept:fd(_fd) {}

	/* virtual methods from class Reader */
	std::size_t Read(std::span<std::byte> dest) override;
};
