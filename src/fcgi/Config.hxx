// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "fcgi-io/Protocol.hxx"

#include <cstddef>

/**
 * Settings for FcgiWriteStream() and FcgiReadStream().
 */
struct FcgiStreamConfig {
	/**
	 * The largest content block put into one record by
	 * FcgiWriteStream().
	 */
	std::size_t max_record_content = FCGI_MAX_CONTENT_LENGTH;

	/**
	 * Pad each record written by FcgiWriteStream() to a multiple
	 * of this many octets.  Must be a power of two not larger than
	 * 256; 1 disables padding.
	 */
	std::size_t alignment = 1;

	/**
	 * FcgiReadStream() refuses to collect more content than this.
	 */
	std::size_t max_stream_length = 1024 * 1024;

	/**
	 * Throws std::runtime_error on error.
	 */
	void Check() const;
};
