// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Error.hxx"

#include <fmt/format.h>

#include <errno.h>
#include <string.h>

FcgiError
MakeFcgiErrno(int error_number, const char *prefix, std::size_t transferred)
{
	return FcgiError{
		FcgiErrorCode::IO,
		fmt::format("{}: {}", prefix, strerror(error_number)),
		error_number, transferred,
	};
}

FcgiError
MakeFcgiTruncated(std::size_t transferred)
{
	return FcgiError{
		FcgiErrorCode::TRUNCATED,
		"Peer closed the socket prematurely",
		EPIPE, transferred,
	};
}
