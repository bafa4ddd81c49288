// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Bounded waits for a #FcgiHandle to become readable or writable.
 */

#pragma once

#include <chrono>
#include <optional>

class FcgiHandle;

/**
 * Wait until a read from the handle will not block (data is
 * available, or the peer has hung up).
 *
 * @param timeout the maximum total wait; std::nullopt waits
 * indefinitely
 * @return true if the handle is ready, false if the timeout has
 * expired
 *
 * Throws #FcgiError (FcgiErrorCode::IO) if poll() fails.
 */
bool
FcgiCanRead(FcgiHandle &handle,
	    std::optional<std::chrono::milliseconds> timeout=std::nullopt);

/**
 * Wait until a write to the handle will not block.
 *
 * @see FcgiCanRead()
 */
bool
FcgiCanWrite(FcgiHandle &handle,
	     std::optional<std::chrono::milliseconds> timeout=std::nullopt);
