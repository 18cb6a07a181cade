// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include "ToBuffer.hxx"
#include "system/Error.hxx" // IWYU pragma: export

/**
 * Like MakeErrno(), but formats the message with libfmt.
 */
template<typename S, typename... Args>
[[nodiscard]]
std::system_error
FmtErrno(int code, const S &format_str, Args&&... args) noexcept
{
	const auto msg = VFmtBuffer<512>(format_str,
					 fmt::make_format_args(args...));
	return MakeErrno(code, msg);
}

template<typename S, typename... Args>
[[nodiscard]]
std::system_error
FmtErrno(const S &format_str, Args&&... args) noexcept
{
	const int code = errno;
	return FmtErrno(code, format_str, args...);
}
