// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "openssl/DeserializeBN.hxx"
#include "openssl/SerializeBN.hxx"
#include "ssh/Serializer.hxx"
#include "lib/openssl/Error.hxx"
#include "memory/fb_pool.hxx"

#include <gtest/gtest.h>

#include <array>
#include <cstring>

static auto
BN_hex2bn(const char *str)
{
	BIGNUM *bn = nullptr;
	const int result = BN_hex2bn(&bn, str);
	if (result <= 0)
		throw SslError{"BN_hex2bn() failed"};

	if (static_cast<std::size_t>(result) != strlen(str))
		throw std::invalid_argument{"BN_hex2bn() failed"};

	return UniqueBIGNUM<false>{bn};
}

class SerializeBignum : public testing::Test {
	const ScopeFbPoolInit fb_pool_init;
};

TEST_F(SerializeBignum, Small)
{
	SSH::Serializer s;
	Serialize(s, *BN_hex2bn("123"));

	const auto result = s.Finish();
	ASSERT_EQ(result.size(), 2U);
	EXPECT_EQ(result[0], std::byte{0x01});
	EXPECT_EQ(result[1], std::byte{0x23});
}

TEST_F(SerializeBignum, HighBit)
{
	SSH::Serializer s;
	Serialize(s, *BN_hex2bn("8042"));

	const auto result = s.Finish();
	ASSERT_EQ(result.size(), 3U);
	EXPECT_EQ(result[0], std::byte{});
	EXPECT_EQ(result[1], std::byte{0x80});
	EXPECT_EQ(result[2], std::byte{0x42});
}

TEST_F(SerializeBignum, P521Scalar)
{
	/* 521 bits = 66 bytes, the top byte has only one bit */
	SSH::Serializer s;
	Serialize(s, *BN_hex2bn("1ff"
				"ffffffffffffffffffffffffffffffffffffffffffffffffffffffffffffffff"
				"ffffffffffffffffffffffffffffffffffffffffffffffffffffffffffffffff"));

	const auto result = s.Finish();
	ASSERT_EQ(result.size(), 66U);
	EXPECT_EQ(result.front(), std::byte{0x01});
	EXPECT_EQ(result.back(), std::byte{0xff});
}

TEST(DeserializeBignum, RoundTrip)
{
	static constexpr std::array data{std::byte{}, std::byte{0x80}, std::byte{0x42}};

	const auto bn = DeserializeBIGNUM(data);
	EXPECT_EQ(BN_num_bytes(bn.get()), 2);
	EXPECT_TRUE(BN_is_word(bn.get(), 0x8042));
}

TEST(DeserializeBignum, Negative)
{
	static constexpr std::array data{std::byte{0x80}, std::byte{0x42}};

	EXPECT_THROW(DeserializeBIGNUM(data), std::invalid_argument);
}

TEST(DeserializeBignum, TooLarge)
{
	const std::array<std::byte, 200> data{std::byte{0x01}};

	EXPECT_THROW(DeserializeBIGNUM(data), std::invalid_argument);
}
