// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "ScriptedHandle.hxx"
#include "SocketPair.hxx"
#include "fcgi/Poll.hxx"
#include "fcgi/Handle.hxx"
#include "fcgi/Error.hxx"

#include <gtest/gtest.h>

#include <climits>
#include <thread>

#include <sys/socket.h>

using std::string_view_literals::operator""sv;
using namespace std::chrono_literals;

TEST(FcgiPoll, CanReadTimeout)
{
	SocketPair sockets;
	FcgiFdHandle handle{sockets.First()};

	const auto start = std::chrono::steady_clock::now();
	EXPECT_FALSE(FcgiCanRead(handle, 0ms));
	EXPECT_FALSE(FcgiCanRead(handle, 20ms));
	EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);

	sockets.SendToFirst("x"sv);
	EXPECT_TRUE(FcgiCanRead(handle, 0ms));
	EXPECT_TRUE(FcgiCanRead(handle));
}

TEST(FcgiPoll, CanReadHangup)
{
	SocketPair sockets;
	sockets.Close(1);

	/* a read will not block; it will report end of input */
	FcgiFdHandle handle{sockets.First()};
	EXPECT_TRUE(FcgiCanRead(handle, 0ms));
}

TEST(FcgiPoll, CanReadBlocksUntilReady)
{
	SocketPair sockets;
	FcgiFdHandle handle{sockets.First()};

	std::thread thread([&sockets]{
		std::this_thread::sleep_for(50ms);
		sockets.SendToFirst("x"sv);
	});

	EXPECT_TRUE(FcgiCanRead(handle));
	thread.join();
}

TEST(FcgiPoll, CanWrite)
{
	SocketPair sockets;
	FcgiFdHandle handle{sockets.Second()};

	EXPECT_TRUE(FcgiCanWrite(handle, 0ms));
	EXPECT_TRUE(FcgiCanWrite(handle));

	/* fill the socket buffer */
	static constexpr char buffer[4096]{};
	while (send(sockets.Second(), buffer, sizeof(buffer),
		    MSG_DONTWAIT|MSG_NOSIGNAL) > 0) {}

	EXPECT_FALSE(FcgiCanWrite(handle, 0ms));
	EXPECT_FALSE(FcgiCanWrite(handle, 10ms));
}

TEST(FcgiPoll, Interrupted)
{
	ScriptedHandle handle;
	handle.poll_errors = {EINTR};

	EXPECT_TRUE(FcgiCanRead(handle, 1000ms));
	ASSERT_EQ(handle.poll_timeouts.size(), 2u);
	EXPECT_EQ(handle.poll_timeouts[0], 1000);
	EXPECT_GT(handle.poll_timeouts[1], 0);
	EXPECT_LE(handle.poll_timeouts[1], 1000);
}

TEST(FcgiPoll, InterruptedIndefinitely)
{
	ScriptedHandle handle;
	handle.poll_errors = {EINTR, EINTR, EINTR};

	EXPECT_TRUE(FcgiCanWrite(handle));
	ASSERT_EQ(handle.poll_timeouts.size(), 4u);
	for (const int timeout : handle.poll_timeouts)
		EXPECT_EQ(timeout, -1);
}

TEST(FcgiPoll, InterruptedDeadline)
{
	/* every wait is interrupted after 20ms; the budget must shrink
	   instead of starting over */
	ScriptedHandle handle;
	handle.poll_errors.assign(100, EINTR);
	handle.poll_error_delay = 20ms;

	const auto start = std::chrono::steady_clock::now();
	EXPECT_FALSE(FcgiCanRead(handle, 100ms));
	const auto duration = std::chrono::steady_clock::now() - start;

	EXPECT_GE(duration, 100ms);
	EXPECT_LT(duration, 1s);
	EXPECT_LT(handle.poll_timeouts.size(), 10u);

	for (std::size_t i = 1; i < handle.poll_timeouts.size(); ++i)
		EXPECT_LT(handle.poll_timeouts[i], handle.poll_timeouts[i - 1]);
}

TEST(FcgiPoll, Error)
{
	ScriptedHandle handle;
	handle.poll_errors = {ENOMEM};

	try {
		FcgiCanRead(handle, 0ms);
		FAIL();
	} catch (const FcgiError &e) {
		EXPECT_EQ(e.GetCode(), FcgiErrorCode::IO);
		EXPECT_EQ(e.GetErrno(), ENOMEM);
	}
}

TEST(FcgiPoll, NotReady)
{
	ScriptedHandle handle;
	handle.poll_ready = false;

	EXPECT_FALSE(FcgiCanRead(handle, 0ms));
	EXPECT_FALSE(FcgiCanWrite(handle, 0ms));
}

TEST(FcgiPoll, HugeTimeout)
{
	/* a timeout beyond the clock's range means "indefinitely" */
	ScriptedHandle handle;
	handle.poll_errors = {EINTR};

	EXPECT_TRUE(FcgiCanRead(handle, std::chrono::milliseconds::max()));
	ASSERT_EQ(handle.poll_timeouts.size(), 2u);
	EXPECT_EQ(handle.poll_timeouts[0], -1);
	EXPECT_EQ(handle.poll_timeouts[1], -1);
}

TEST(FcgiPoll, NegativeTimeout)
{
	ScriptedHandle handle;
	handle.poll_ready = false;

	EXPECT_FALSE(FcgiCanWrite(handle, std::chrono::milliseconds::min()));
	ASSERT_EQ(handle.poll_timeouts.size(), 1u);
	EXPECT_EQ(handle.poll_timeouts[0], 0);
}

TEST(FcgiPoll, LargeTimeout)
{
	/* representable, but longer than poll() accepts */
	ScriptedHandle handle;
	handle.poll_errors = {EINTR};

	EXPECT_TRUE(FcgiCanRead(handle, std::chrono::hours{24 * 365 * 100}));
	ASSERT_EQ(handle.poll_timeouts.size(), 2u);
	EXPECT_EQ(handle.poll_timeouts[0], INT_MAX);
	EXPECT_EQ(handle.poll_timeouts[1], INT_MAX);
}
