// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Load and store big-endian integers at unaligned addresses.
 */

#pragma once

#include <cstddef>
#include <cstdint>

constexpr uint_least16_t
LoadBE16(const std::byte *src) noexcept
{
	return (static_cast<uint_least16_t>(src[0]) << 8) |
		static_cast<uint_least16_t>(src[1]);
}

constexpr void
StoreBE16(std::byte *dest, uint_least16_t value) noexcept
{
	dest[0] = static_cast<std::byte>(value >> 8);
	dest[1] = static_cast<std::byte>(value);
}
