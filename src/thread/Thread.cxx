// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Thread.hxx"
#include "Name.hxx"
#include "system/Error.hxx"

void
Thread::Start()
{
	assert(!IsDefined());

	const int e = pthread_create(&handle, nullptr, ThreadProc, this);
	if (e != 0) {
		handle = pthread_t();
		throw MakeErrno(e, "Failed to create thread");
	}
}

void
Thread::Join() noexcept
{
	assert(IsDefined());
	assert(!pthread_equal(pthread_self(), inside_handle));

	pthread_join(handle, nullptr);
	handle = pthread_t();

#ifndef NDEBUG
	inside_handle = pthread_t();
#endif
}

void *
Thread::ThreadProc(void *ctx) noexcept
{
	Thread &thread = *(Thread *)ctx;

#ifndef NDEBUG
	thread.inside_handle = pthread_self();
#endif

	SetThreadName(thread.name);
	thread.f();

	return nullptr;
}
