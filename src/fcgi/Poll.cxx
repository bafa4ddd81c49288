// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Poll.hxx"
#include "Handle.hxx"
#include "Error.hxx"
#include "Logger.hxx"

#include <algorithm>
#include <climits>

#include <errno.h>
#include <poll.h>

static const NamedLogger logger{"fcgi_poll"};

using std::chrono::milliseconds;
using Clock = std::chrono::steady_clock;

static int
ToPollTimeout(milliseconds timeout) noexcept
{
	return static_cast<int>(std::clamp<milliseconds::rep>(timeout.count(),
							      0, INT_MAX));
}

/**
 * Evaluate the result of FcgiHandle::Poll().
 *
 * @return true if the handle is ready, false on timeout, std::nullopt
 * if the call was interrupted by a signal
 */
static std::optional<bool>
CheckPollResult(int result, short revents)
{
	if (result > 0) {
		if (revents & POLLNVAL) [[unlikely]]
			throw MakeFcgiErrno(EBADF, "poll() failed");

		/* POLLHUP and POLLERR count as "ready": the next
		   read or write will not block but report the
		   condition */
		return true;
	}

	if (result == 0)
		return false;

	if (errno != EINTR)
		throw MakeFcgiErrno(errno, "poll() failed");

	logger.Log(5, "poll() interrupted, retrying");
	return std::nullopt;
}

static bool
PollFor(FcgiHandle &handle, short events,
	std::optional<milliseconds> timeout)
{
	short revents = 0;

	const auto now = Clock::now();

	if (timeout) {
		if (timeout->count() < 0)
			timeout = milliseconds::zero();
		else if (*timeout >= std::chrono::duration_cast<milliseconds>(Clock::time_point::max() - now))
			/* the deadline cannot be represented; this is
			   as good as waiting indefinitely */
			timeout.reset();
	}

	if (!timeout) {
		while (true) {
			const int result = handle.Poll(events, revents, -1);
			if (const auto ready = CheckPollResult(result, revents))
				return *ready;
		}
	}

	const auto deadline = now + *timeout;
	milliseconds remaining = *timeout;

	while (true) {
		const int result = handle.Poll(events, revents,
					       ToPollTimeout(remaining));
		if (const auto ready = CheckPollResult(result, revents))
			return *ready;

		/* interrupted: wait only for what is left of the
		   original budget */
		remaining = std::chrono::ceil<milliseconds>(deadline - Clock::now());
		if (remaining.count() <= 0)
			return false;
	}
}

bool
FcgiCanRead(FcgiHandle &handle, std::optional<milliseconds> timeout)
{
	return PollFor(handle, POLLIN, timeout);
}

bool
FcgiCanWrite(FcgiHandle &handle, std::optional<milliseconds> timeout)
{
	return PollFor(handle, POLLOUT, timeout);
}
