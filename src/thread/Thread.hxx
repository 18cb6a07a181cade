// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef VPLAY_THREAD_HXX
#define VPLAY_THREAD_HXX

#include <cassert>
#include <functional>
#include <utility>

#include <pthread.h>

/**
 * A joinable POSIX thread running a function object; vplay runs one
 * for the player and one per decoding #Source.  Every started
 * thread must be cleaned up with Join().
 */
class Thread {
	using Function = std::function<void()>;

	/**
	 * Passed to SetThreadName() by the new thread.
	 */
	const char *const name;

	const Function f;

	pthread_t handle = pthread_t();

#ifndef NDEBUG
	/**
	 * Set by the thread function.  #handle is set by
	 * pthread_create() only after the thread may have started
	 * running.
	 */
	pthread_t inside_handle = pthread_t();
#endif

public:
	Thread(const char *_name, Function _f) noexcept
		:name(_name), f(std::move(_f)) {}

	Thread(const Thread &) = delete;
	Thread &operator=(const Thread &) = delete;

#ifndef NDEBUG
	~Thread() noexcept {
		assert(!IsDefined());
	}
#endif

	/**
	 * Has Start() been called without a Join() call?
	 */
	bool IsDefined() const noexcept {
		return handle != pthread_t();
	}

	/**
	 * Start the thread.
	 *
	 * Throws #std::system_error on error.
	 */
	void Start();

	/**
	 * Wait for the function to return.  Must not be called from
	 * inside the thread.
	 */
	void Join() noexcept;

private:
	static void *ThreadProc(void *ctx) noexcept;
};

#endif
