// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Serialize and deserialize the FastCGI record header.
 */

#pragma once

#include "fcgi-io/Protocol.hxx"
#include "util/BigEndian.hxx"

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

/**
 * The decoded fields of a FastCGI record header.  The version and
 * reserved octets are not part of it.
 */
struct FcgiHeader {
	uint8_t type;
	uint_least16_t request_id;
	uint_least16_t content_length;
	uint8_t padding_length;

	constexpr bool operator==(const FcgiHeader &) const noexcept = default;
};

using FcgiHeaderBuffer = std::array<std::byte, FCGI_HEADER_SIZE>;

/**
 * Decode the first #FCGI_HEADER_SIZE octets of the given buffer.
 * The version octet is not checked.
 *
 * Throws #FcgiError (FcgiErrorCode::MALFORMED_HEADER) if fewer than
 * #FCGI_HEADER_SIZE octets were passed.
 */
FcgiHeader
ParseFcgiHeader(std::span<const std::byte> src);

/**
 * Encode a header with version #FCGI_VERSION_1.
 */
constexpr FcgiHeaderBuffer
SerializeFcgiHeader(uint8_t type, uint_least16_t request_id,
		    uint_least16_t content_length,
		    uint8_t padding_length) noexcept
{
	FcgiHeaderBuffer buffer{};
	buffer[0] = static_cast<std::byte>(FCGI_VERSION_1);
	buffer[1] = static_cast<std::byte>(type);
	StoreBE16(&buffer[2], request_id);
	StoreBE16(&buffer[4], content_length);
	buffer[6] = static_cast<std::byte>(padding_length);
	return buffer;
}

constexpr FcgiHeaderBuffer
SerializeFcgiHeader(const FcgiHeader &header) noexcept
{
	return SerializeFcgiHeader(header.type, header.request_id,
				   header.content_length,
				   header.padding_length);
}
