// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Constants of the FastCGI wire protocol.  Record types and roles
 * are opaque to this library; the application protocol layer defines
 * them.
 */

#pragma once

#include <cstddef>
#include <cstdint>

static constexpr uint8_t FCGI_VERSION_1 = 1;

/**
 * The size of a serialized record header.
 */
static constexpr std::size_t FCGI_HEADER_SIZE = 8;

/**
 * The largest content block a single record can carry.
 */
static constexpr std::size_t FCGI_MAX_CONTENT_LENGTH = 0xffff;

static constexpr std::size_t FCGI_MAX_PADDING_LENGTH = 0xff;

/*
 * Header layout (all multi-octet fields are big-endian):
 *
 *   0  version
 *   1  type
 *   2  request_id (2 octets)
 *   4  content_length (2 octets)
 *   6  padding_length
 *   7  reserved
 *
 * followed by content_length content octets and padding_length
 * padding octets.
 */
