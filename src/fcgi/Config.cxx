// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Config.hxx"

#include <fmt/format.h>

#include <bit>
#include <stdexcept>

void
FcgiStreamConfig::Check() const
{
	if (max_record_content == 0 ||
	    max_record_content > FCGI_MAX_CONTENT_LENGTH)
		throw std::runtime_error{fmt::format("Invalid max_record_content {}; must be 1..{}",
						     max_record_content,
						     FCGI_MAX_CONTENT_LENGTH)};

	if (!std::has_single_bit(alignment) ||
	    alignment > FCGI_MAX_PADDING_LENGTH + 1)
		throw std::runtime_error{fmt::format("Invalid alignment {}; must be a power of two up to {}",
						     alignment,
						     FCGI_MAX_PADDING_LENGTH + 1)};

	if (max_stream_length == 0)
		throw std::runtime_error{"max_stream_length must not be zero"};
}
