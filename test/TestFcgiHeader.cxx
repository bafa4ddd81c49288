// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "fcgi/Header.hxx"
#include "fcgi/Error.hxx"

#include <gtest/gtest.h>

static constexpr std::byte
B(unsigned value) noexcept
{
	return static_cast<std::byte>(value);
}

TEST(FcgiHeader, Layout)
{
	const auto buffer = SerializeFcgiHeader(6, 0x1234, 0xabcd, 7);

	const FcgiHeaderBuffer expected{
		B(1), B(6), B(0x12), B(0x34), B(0xab), B(0xcd), B(7), B(0),
	};

	EXPECT_EQ(buffer, expected);
}

TEST(FcgiHeader, Parse)
{
	const FcgiHeaderBuffer buffer{
		B(1), B(5), B(0x00), B(0x01), B(0x01), B(0x00), B(0xff), B(0x42),
	};

	const auto header = ParseFcgiHeader(buffer);
	EXPECT_EQ(header.type, 5);
	EXPECT_EQ(header.request_id, 1);
	EXPECT_EQ(header.content_length, 256);
	EXPECT_EQ(header.padding_length, 0xff);
}

TEST(FcgiHeader, RoundTrip)
{
	static constexpr FcgiHeader headers[] = {
		{0, 0, 0, 0},
		{1, 1, 8, 0},
		{6, 0x8000, 0x7fff, 1},
		{0xff, 0xffff, 0xffff, 0xff},
	};

	for (const auto &header : headers)
		EXPECT_EQ(ParseFcgiHeader(SerializeFcgiHeader(header)), header);
}

TEST(FcgiHeader, ParseIgnoresVersionAndExtraOctets)
{
	const std::byte buffer[] = {
		B(9), B(3), B(0), B(2), B(0), B(0), B(0), B(0xff), B(0x55),
	};

	const auto header = ParseFcgiHeader(buffer);
	EXPECT_EQ(header.type, 3);
	EXPECT_EQ(header.request_id, 2);
	EXPECT_EQ(header.content_length, 0);
	EXPECT_EQ(header.padding_length, 0);
}

TEST(FcgiHeader, TooShort)
{
	const auto buffer = SerializeFcgiHeader(1, 2, 3, 4);

	for (std::size_t n = 0; n < buffer.size(); ++n) {
		try {
			ParseFcgiHeader(std::span{buffer}.first(n));
			FAIL() << "no exception for " << n << " octets";
		} catch (const FcgiError &e) {
			EXPECT_EQ(e.GetCode(), FcgiErrorCode::MALFORMED_HEADER);
		}
	}
}
