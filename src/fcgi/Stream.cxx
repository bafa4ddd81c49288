// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Stream.hxx"
#include "RecordIO.hxx"
#include "Error.hxx"
#include "Logger.hxx"

static const NamedLogger logger{"fcgi_stream"};

std::size_t
FcgiWriteStream(FcgiHandle &handle, uint8_t type, uint_least16_t request_id,
		std::span<const std::byte> content, bool terminate,
		const FcgiStreamConfig &config)
{
	config.Check();

	std::size_t total = 0;

	try {
		while (!content.empty()) {
			auto chunk = content;
			if (chunk.size() > config.max_record_content)
				chunk = chunk.first(config.max_record_content);

			total += FcgiWriteRecord(handle, type, request_id, chunk,
						 FcgiPaddingLength(FCGI_HEADER_SIZE + chunk.size(),
								   config.alignment));
			content = content.subspan(chunk.size());
		}

		if (terminate)
			total += FcgiWriteRecord(handle, type, request_id, {},
						 FcgiPaddingLength(FCGI_HEADER_SIZE,
								   config.alignment));
	} catch (FcgiError &e) {
		e.AddTransferred(total);
		throw;
	}

	return total;
}

/**
 * Read one record of the stream.  End of input before the
 * terminator is a truncation unless no record has been read yet.
 */
static std::optional<FcgiRecord>
ReadStreamRecord(FcgiHandle &handle, uint8_t type, uint_least16_t request_id,
		 bool first)
{
	auto record = FcgiReadRecord(handle);
	if (!record) {
		if (first)
			return std::nullopt;

		throw MakeFcgiTruncated(0);
	}

	if (record->type != type || record->request_id != request_id)
		throw FmtFcgiError(FcgiErrorCode::UNEXPECTED_RECORD,
				   "Unexpected FastCGI record type={} request_id={} in stream type={} request_id={}",
				   record->type, record->request_id,
				   type, request_id);

	return record;
}

std::optional<std::vector<std::byte>>
FcgiReadStream(FcgiHandle &handle, uint8_t type, uint_least16_t request_id,
	       const FcgiStreamConfig &config)
{
	config.Check();

	std::vector<std::byte> result;

	try {
		for (bool first = true;; first = false) {
			auto record = ReadStreamRecord(handle, type, request_id,
						       first);
			if (!record)
				return std::nullopt;

			if (record->content.empty())
				/* end of stream */
				return result;

			if (record->content.size() > config.max_stream_length - result.size())
				throw FmtFcgiError(FcgiErrorCode::CONTENT_TOO_LARGE,
						   "FastCGI stream exceeds {} octets",
						   config.max_stream_length);

			result.insert(result.end(),
				      record->content.begin(),
				      record->content.end());
		}
	} catch (const FcgiError &e) {
		logger.Log(2, "Failed to read FastCGI stream", e);
		throw;
	}
}
