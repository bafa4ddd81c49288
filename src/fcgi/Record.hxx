// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Serialize and deserialize complete FastCGI records.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

struct FcgiRecord {
	uint8_t type;
	uint_least16_t request_id;
	std::vector<std::byte> content;
};

/**
 * Calculate the number of padding octets which round a record with
 * the given content length up to a multiple of #alignment.
 *
 * @param alignment a power of two not larger than 256
 */
constexpr std::size_t
FcgiPaddingLength(std::size_t content_length, std::size_t alignment) noexcept
{
	return (alignment - (content_length % alignment)) % alignment;
}

/**
 * Throws #FcgiError (FcgiErrorCode::CONTENT_TOO_LARGE) if the given
 * lengths cannot be encoded in one record header.
 */
void
CheckFcgiRecordSize(std::size_t content_length, std::size_t padding_length);

/**
 * Build header, content and (zeroed) padding of one record.
 *
 * Throws #FcgiError (FcgiErrorCode::CONTENT_TOO_LARGE) if the
 * content does not fit into one record or the padding exceeds 255
 * octets.
 */
std::vector<std::byte>
SerializeFcgiRecord(uint8_t type, uint_least16_t request_id,
		    std::span<const std::byte> content={},
		    std::size_t padding_length=0);

/**
 * Combine an encoded header with its content block.  Octets beyond
 * the header's content length are ignored.
 *
 * Throws #FcgiError (FcgiErrorCode::MALFORMED_HEADER) if the header
 * is too short or the content block is shorter than announced.
 */
FcgiRecord
ParseFcgiRecord(std::span<const std::byte> header,
		std::span<const std::byte> content);
