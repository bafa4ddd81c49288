// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "RecordIO.hxx"
#include "Transfer.hxx"
#include "Error.hxx"

std::optional<FcgiHeader>
FcgiReadHeader(FcgiHandle &handle)
{
	FcgiHeaderBuffer buffer;
	if (!FcgiReadFull(handle, buffer))
		return std::nullopt;

	return ParseFcgiHeader(buffer);
}

std::optional<FcgiRecord>
FcgiReadRecord(FcgiHandle &handle)
{
	FcgiHeaderBuffer header_buffer;
	if (!FcgiReadFull(handle, header_buffer))
		return std::nullopt;

	const auto header = ParseFcgiHeader(header_buffer);

	std::vector<std::byte> content(header.content_length);
	std::size_t position = header_buffer.size();

	/* the header has been consumed already, therefore end of
	   input from here on is always a truncation */
	try {
		if (!FcgiReadFull(handle, content))
			throw MakeFcgiTruncated(0);

		position += content.size();

		if (!FcgiDiscardFull(handle, header.padding_length))
			throw MakeFcgiTruncated(0);
	} catch (FcgiError &e) {
		e.AddTransferred(position);
		throw;
	}

	return ParseFcgiRecord(header_buffer, content);
}

std::size_t
FcgiWriteHeader(FcgiHandle &handle, uint8_t type, uint_least16_t request_id,
		std::size_t content_length, std::size_t padding_length)
{
	CheckFcgiRecordSize(content_length, padding_length);

	const auto buffer =
		SerializeFcgiHeader(type, request_id,
				    static_cast<uint_least16_t>(content_length),
				    static_cast<uint8_t>(padding_length));
	return FcgiWriteFull(handle, buffer);
}

std::size_t
FcgiWriteRecord(FcgiHandle &handle, uint8_t type, uint_least16_t request_id,
		std::span<const std::byte> content,
		std::size_t padding_length)
{
	const auto buffer = SerializeFcgiRecord(type, request_id, content,
						padding_length);
	return FcgiWriteFull(handle, buffer);
}
