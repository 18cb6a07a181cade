// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include <array>
#include <cstddef>

/**
 * A statically allocated string buffer.
 */
template<std::size_t CAPACITY>
class StringBuffer {
	std::array<char, CAPACITY> buffer;

public:
	static_assert(CAPACITY > 0);

	constexpr StringBuffer() noexcept {
		buffer.front() = 0;
	}

	constexpr char *data() noexcept {
		return buffer.data();
	}

	constexpr const char *c_str() const noexcept {
		return buffer.data();
	}

	constexpr operator const char *() const noexcept {
		return c_str();
	}

	static constexpr std::size_t capacity() noexcept {
		return CAPACITY;
	}
};
