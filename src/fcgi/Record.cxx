// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Record.hxx"
#include "Header.hxx"
#include "Error.hxx"

void
CheckFcgiRecordSize(std::size_t content_length, std::size_t padding_length)
{
	if (content_length > FCGI_MAX_CONTENT_LENGTH) [[unlikely]]
		throw FmtFcgiError(FcgiErrorCode::CONTENT_TOO_LARGE,
				   "FastCGI record content too large ({} octets)",
				   content_length);

	if (padding_length > FCGI_MAX_PADDING_LENGTH) [[unlikely]]
		throw FmtFcgiError(FcgiErrorCode::CONTENT_TOO_LARGE,
				   "FastCGI record padding too large ({} octets)",
				   padding_length);
}

std::vector<std::byte>
SerializeFcgiRecord(uint8_t type, uint_least16_t request_id,
		    std::span<const std::byte> content,
		    std::size_t padding_length)
{
	CheckFcgiRecordSize(content.size(), padding_length);

	const auto header =
		SerializeFcgiHeader(type, request_id,
				    static_cast<uint_least16_t>(content.size()),
				    static_cast<uint8_t>(padding_length));

	std::vector<std::byte> result;
	result.reserve(header.size() + content.size() + padding_length);
	result.insert(result.end(), header.begin(), header.end());
	result.insert(result.end(), content.begin(), content.end());
	result.resize(result.size() + padding_length, std::byte{});
	return result;
}

FcgiRecord
ParseFcgiRecord(std::span<const std::byte> header_buffer,
		std::span<const std::byte> content)
{
	const auto header = ParseFcgiHeader(header_buffer);
	if (content.size() < header.content_length) [[unlikely]]
		throw FmtFcgiError(FcgiErrorCode::MALFORMED_HEADER,
				   "FastCGI content block too short ({} of {} octets)",
				   content.size(), header.content_length);

	content = content.first(header.content_length);

	return {
		.type = header.type,
		.request_id = header.request_id,
		.content = {content.begin(), content.end()},
	};
}
