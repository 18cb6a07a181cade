// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Error.hxx"

const char *
ToString(AudioErrorCode code) noexcept
{
	switch (code) {
	case AudioErrorCode::UNSUPPORTED_FORMAT:
		return "unsupported_format";

	case AudioErrorCode::DECODE:
		return "decode";

	case AudioErrorCode::NOT_FOUND:
		return "not_found";

	case AudioErrorCode::IO:
		return "io";

	case AudioErrorCode::ENGINE_UNAVAILABLE:
		return "engine_unavailable";

	case AudioErrorCode::TIMEOUT:
		return "timeout";
	}

	return "unknown";
}
