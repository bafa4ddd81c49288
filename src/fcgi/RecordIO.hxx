// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Blocking reads and writes of single FastCGI records.
 */

#pragma once

#include "Header.hxx"
#include "Record.hxx"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

class FcgiHandle;

/**
 * Read one record header.
 *
 * @return the header, or std::nullopt if the peer closed the stream
 * at a record boundary
 *
 * Throws #FcgiError on I/O error or if the stream ends inside the
 * header.
 */
std::optional<FcgiHeader>
FcgiReadHeader(FcgiHandle &handle);

/**
 * Read one record: header, content and padding.  The padding is
 * discarded, leaving the stream at the next record boundary.
 *
 * @return the record, or std::nullopt if the peer closed the stream
 * at a record boundary
 *
 * Throws #FcgiError on I/O error or if the stream ends anywhere
 * inside the record.
 */
std::optional<FcgiRecord>
FcgiReadRecord(FcgiHandle &handle);

/**
 * Write one record header.  The content and padding must be written
 * by the caller.
 *
 * Throws #FcgiError (FcgiErrorCode::CONTENT_TOO_LARGE) before
 * writing anything if a length does not fit into its field.
 *
 * @return the number of octets written
 */
std::size_t
FcgiWriteHeader(FcgiHandle &handle, uint8_t type, uint_least16_t request_id,
		std::size_t content_length, std::size_t padding_length);

/**
 * Write one complete record.
 *
 * @param padding_length the number of zero octets appended after
 * the content
 * @return the number of octets written (header, content and
 * padding)
 */
std::size_t
FcgiWriteRecord(FcgiHandle &handle, uint8_t type, uint_least16_t request_id,
		std::span<const std::byte> content={},
		std::size_t padding_length=0);
