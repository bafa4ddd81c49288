// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Loop-until-complete transfers over a blocking #FcgiHandle.
 * Interrupted system calls (EINTR) are retried transparently; all
 * other failures throw #FcgiError.
 */

#pragma once

#include <cstddef>
#include <span>

class FcgiHandle;

/**
 * Fill the whole buffer from the handle.
 *
 * @return true on success, false if the peer closed the stream
 * before the first octet arrived
 *
 * Throws #FcgiError with FcgiErrorCode::TRUNCATED if the peer closed
 * the stream after some but not all octets, and with
 * FcgiErrorCode::IO if a read failed; the contents of #dest are
 * undefined then.
 */
[[nodiscard]]
bool
FcgiReadFull(FcgiHandle &handle, std::span<std::byte> dest);

/**
 * Read and drop exactly #size octets.  End-of-input is classified
 * like FcgiReadFull() does.
 *
 * @return true on success, false if the peer closed the stream
 * before the first octet arrived
 */
[[nodiscard]]
bool
FcgiDiscardFull(FcgiHandle &handle, std::size_t size);

/**
 * Write the whole buffer to the handle, continuing after short
 * writes.
 *
 * @return the number of octets written, which is always
 * src.size()
 *
 * Throws #FcgiError with FcgiErrorCode::IO on failure;
 * FcgiError::GetTransferred() tells how many octets were written
 * before that.
 */
std::size_t
FcgiWriteFull(FcgiHandle &handle, std::span<const std::byte> src);
