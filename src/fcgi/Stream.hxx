// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * FastCGI streams: an unbounded octet sequence carried by a series of
 * records with the same type and request id, optionally terminated
 * by an empty record.
 */

#pragma once

#include "Config.hxx"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

class FcgiHandle;

/**
 * Split #content into records of at most
 * FcgiStreamConfig::max_record_content octets and write them in
 * order.  If #terminate is true, an empty record follows.  Nothing is
 * written if #content is empty and #terminate is false.
 *
 * Throws #FcgiError on failure; FcgiError::GetTransferred() counts
 * all octets written by this call.
 *
 * @return the number of octets written (headers, content and
 * padding)
 */
std::size_t
FcgiWriteStream(FcgiHandle &handle, uint8_t type, uint_least16_t request_id,
		std::span<const std::byte> content, bool terminate=false,
		const FcgiStreamConfig &config={});

/**
 * Collect the content of all records up to and including the empty
 * terminator record.
 *
 * @return the content, or std::nullopt if the peer closed the stream
 * before the first record
 *
 * Throws #FcgiError if the stream ends before the terminator, if a
 * record with another type or request id arrives, or if the content
 * exceeds FcgiStreamConfig::max_stream_length.
 */
std::optional<std::vector<std::byte>>
FcgiReadStream(FcgiHandle &handle, uint8_t type, uint_least16_t request_id,
	       const FcgiStreamConfig &config={});
