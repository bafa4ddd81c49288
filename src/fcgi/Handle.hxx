// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstddef>
#include <span>

#include <sys/types.h>

/**
 * An open, connected byte stream owned by the caller.  The methods
 * have the semantics of the system calls they are named after: on
 * failure, they return -1 and set errno.
 */
class FcgiHandle {
public:
	virtual ~FcgiHandle() noexcept = default;

	/**
	 * Like read(2).  Returns 0 on end of input.
	 */
	virtual ssize_t Read(std::span<std::byte> dest) noexcept = 0;

	/**
	 * Like write(2).  May write fewer octets than requested.
	 */
	virtual ssize_t Write(std::span<const std::byte> src) noexcept = 0;

	/**
	 * Like poll(2) on this handle alone.
	 *
	 * @param events a mask of POLLIN, POLLOUT
	 * @param timeout_ms the timeout in milliseconds; negative
	 * means wait indefinitely
	 * @return a positive value with the ready events stored in
	 * #revents, 0 on timeout, -1 on error
	 */
	virtual int Poll(short events, short &revents,
			 int timeout_ms) noexcept = 0;
};

/**
 * A #FcgiHandle wrapping a file descriptor (usually a socket).  The
 * descriptor is not owned; the destructor does not close it.
 */
class FcgiFdHandle final : public FcgiHandle {
	const int fd;

public:
	explicit constexpr FcgiFdHandle(int _fd) noexcept
		:fd(_fd) {}

	int Get() const noexcept {
		return fd;
	}

	ssize_t Read(std::span<std::byte> dest) noexcept override;
	ssize_t Write(std::span<const std::byte> src) noexcept override;
	int Poll(short events, short &revents, int timeout_ms) noexcept override;
};
