// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Handle.hxx"

#include <errno.h>
#include <poll.h>
#include <pthread.h>
#include <signal.h>
#include <sys/socket.h>
#include <time.h>
#include <unistd.h>

ssize_t
FcgiFdHandle::Read(std::span<std::byte> dest) noexcept
{
	return read(fd, dest.data(), dest.size());
}

/**
 * Like write(), but a closed reader results in EPIPE instead of
 * SIGPIPE.  The signal is blocked in the calling thread for the
 * duration of the call, and a SIGPIPE generated by this write() is
 * consumed before the old mask is restored.
 */
static ssize_t
WriteNoSignal(int fd, std::span<const std::byte> src) noexcept
{
	sigset_t pipe_set, old_set, pending;
	sigemptyset(&pipe_set);
	sigaddset(&pipe_set, SIGPIPE);

	/* a SIGPIPE which was pending before belongs to somebody
	   else and must not be consumed */
	sigpending(&pending);
	const bool was_pending = sigismember(&pending, SIGPIPE) == 1;

	pthread_sigmask(SIG_BLOCK, &pipe_set, &old_set);

	const ssize_t nbytes = write(fd, src.data(), src.size());
	const int write_errno = errno;

	if (nbytes < 0 && write_errno == EPIPE && !was_pending) {
		static constexpr struct timespec zero{};
		while (sigtimedwait(&pipe_set, nullptr, &zero) < 0 &&
		       errno == EINTR) {}
	}

	pthread_sigmask(SIG_SETMASK, &old_set, nullptr);

	errno = write_errno;
	return nbytes;
}

ssize_t
FcgiFdHandle::Write(std::span<const std::byte> src) noexcept
{
	/* send() with MSG_NOSIGNAL reports a closed peer as EPIPE
	   instead of raising SIGPIPE; other descriptor types fall
	   back to write() with SIGPIPE blocked */
	const ssize_t nbytes = send(fd, src.data(), src.size(), MSG_NOSIGNAL);
	if (nbytes < 0 && errno == ENOTSOCK)
		return WriteNoSignal(fd, src);
	return nbytes;
}

int
FcgiFdHandle::Poll(short events, short &revents, int timeout_ms) noexcept
{
	struct pollfd pfd{
		.fd = fd,
		.events = events,
		.revents = 0,
	};

	const int result = poll(&pfd, 1, timeout_ms);
	revents = pfd.revents;
	return result;
}
