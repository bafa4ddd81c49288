// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Header.hxx"
#include "Error.hxx"
#include "util/BigEndian.hxx"

FcgiHeader
ParseFcgiHeader(std::span<const std::byte> src)
{
	if (src.size() < FCGI_HEADER_SIZE) [[unlikely]]
		throw FmtFcgiError(FcgiErrorCode::MALFORMED_HEADER,
				   "FastCGI header too short ({} octets)",
				   src.size());

	return {
		.type = static_cast<uint8_t>(src[1]),
		.request_id = LoadBE16(&src[2]),
		.content_length = LoadBE16(&src[4]),
		.padding_length = static_cast<uint8_t>(src[6]),
	};
}
