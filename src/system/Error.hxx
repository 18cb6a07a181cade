// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include <cerrno> // IWYU pragma: export
#include <system_error> // IWYU pragma: export

[[nodiscard]]
static inline std::system_error
MakeErrno(int code, const char *msg) noexcept
{
	return std::system_error(std::error_code(code, std::system_category()),
				 msg);
}

[[nodiscard]]
static inline std::system_error
MakeErrno(const char *msg) noexcept
{
	return MakeErrno(errno, msg);
}

/**
 * Does this error mean that the file does not exist?  That
 * includes a path with a directory component that does not exist
 * (ENOENT) or is not a directory (ENOTDIR).
 */
[[gnu::pure]]
static inline bool
IsFileNotFound(const std::system_error &e) noexcept
{
	if (e.code().category() != std::system_category())
		return false;

	const int code = e.code().value();
	return code == ENOENT || code == ENOTDIR;
}
