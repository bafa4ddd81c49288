// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Transfer.hxx"
#include "Handle.hxx"
#include "Error.hxx"
#include "Logger.hxx"

#include <algorithm>

#include <errno.h>

static const NamedLogger logger{"fcgi_transfer"};

/**
 * Invoke FcgiHandle::Read() until it is not interrupted by a signal.
 */
static ssize_t
ReadRetry(FcgiHandle &handle, std::span<std::byte> dest)
{
	while (true) {
		const ssize_t nbytes = handle.Read(dest);
		if (nbytes >= 0 || errno != EINTR) [[likely]]
			return nbytes;

		logger.Log(5, "read interrupted, retrying");
	}
}

bool
FcgiReadFull(FcgiHandle &handle, std::span<std::byte> dest)
{
	std::size_t position = 0;

	while (position < dest.size()) {
		const ssize_t nbytes = ReadRetry(handle, dest.subspan(position));
		if (nbytes < 0)
			throw MakeFcgiErrno(errno, "Failed to receive", position);

		if (nbytes == 0) {
			if (position == 0)
				return false;

			logger.Fmt(3, "peer closed after {} of {} octets",
				   position, dest.size());
			throw MakeFcgiTruncated(position);
		}

		position += static_cast<std::size_t>(nbytes);
	}

	return true;
}

bool
FcgiDiscardFull(FcgiHandle &handle, std::size_t size)
{
	std::byte buffer[4096];
	std::size_t position = 0;

	while (position < size) {
		const std::size_t chunk = std::min(size - position,
						   sizeof(buffer));

		try {
			if (!FcgiReadFull(handle, std::span{buffer}.first(chunk))) {
				if (position == 0)
					return false;

				throw MakeFcgiTruncated(0);
			}
		} catch (FcgiError &e) {
			e.AddTransferred(position);
			throw;
		}

		position += chunk;
	}

	return true;
}

std::size_t
FcgiWriteFull(FcgiHandle &handle, std::span<const std::byte> src)
{
	std::size_t position = 0;

	while (position < src.size()) {
		const ssize_t nbytes = handle.Write(src.subspan(position));
		if (nbytes < 0) {
			if (errno == EINTR) {
				logger.Log(5, "write interrupted, retrying");
				continue;
			}

			throw MakeFcgiErrno(errno, "Failed to send", position);
		}

		if (nbytes == 0) [[unlikely]]
			/* write() made no progress and did not report
			   an error; bail out instead of spinning */
			throw MakeFcgiErrno(EIO, "Failed to send", position);

		position += static_cast<std::size_t>(nbytes);
	}

	return position;
}
