// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <fmt/core.h>

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

/**
 * Error codes for #FcgiError.
 */
enum class FcgiErrorCode {
	/**
	 * The peer closed the stream in the middle of a header,
	 * content block or padding.
	 */
	TRUNCATED,

	/**
	 * A system call failed; see FcgiError::GetErrno().
	 */
	IO,

	/**
	 * The caller asked to transfer more content or padding than
	 * fits into one record (or into the configured stream limit).
	 */
	CONTENT_TOO_LARGE,

	/**
	 * A header or record could not be decoded from the given
	 * octets.  This indicates a bug in the caller.
	 */
	MALFORMED_HEADER,

	/**
	 * A record of another type or request id appeared in the
	 * middle of a stream.
	 */
	UNEXPECTED_RECORD,
};

class FcgiError : public std::runtime_error {
	FcgiErrorCode code;

	/**
	 * The errno value describing this error, or 0.
	 */
	int error_number;

	/**
	 * The number of octets confirmed by the peer before this error
	 * occurred.  For diagnostics only.
	 */
	std::size_t transferred;

public:
	FcgiError(FcgiErrorCode _code, const char *_msg,
		  int _error_number=0, std::size_t _transferred=0)
		:std::runtime_error(_msg), code(_code),
		 error_number(_error_number), transferred(_transferred) {}

	FcgiError(FcgiErrorCode _code, const std::string &_msg,
		  int _error_number=0, std::size_t _transferred=0)
		:std::runtime_error(_msg), code(_code),
		 error_number(_error_number), transferred(_transferred) {}

	FcgiErrorCode GetCode() const noexcept {
		return code;
	}

	int GetErrno() const noexcept {
		return error_number;
	}

	std::size_t GetTransferred() const noexcept {
		return transferred;
	}

	/**
	 * Account octets which were transferred by earlier calls
	 * belonging to the same operation.
	 */
	void AddTransferred(std::size_t n) noexcept {
		transferred += n;
	}
};

/**
 * Construct a #FcgiError with a message formatted by libfmt.
 */
template<typename... Args>
FcgiError
FmtFcgiError(FcgiErrorCode code, fmt::format_string<Args...> format_str,
	     Args&&... args)
{
	return FcgiError{code, fmt::format(format_str, std::forward<Args>(args)...)};
}

/**
 * Construct a #FcgiError with code FcgiErrorCode::IO; the message is
 * the given prefix followed by strerror(error_number).
 */
FcgiError
MakeFcgiErrno(int error_number, const char *prefix,
	      std::size_t transferred=0);

/**
 * Construct the #FcgiError reported when the peer closes the stream
 * after some but not all octets of a message have arrived.
 */
FcgiError
MakeFcgiTruncated(std::size_t transferred);
