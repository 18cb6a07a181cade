// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef THREAD_FUTURE_HXX
#define THREAD_FUTURE_HXX

#include <future>

/**
 * A one-shot channel carrying a value or an exception from one thread
 * to another.
 */
template <typename R>
using Future = std::future<R>;
template <typename R>
using Promise = std::promise<R>;

#endif
