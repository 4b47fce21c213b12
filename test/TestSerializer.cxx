// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "ssh/Serializer.hxx"
#include "ssh/Deserializer.hxx"
#include "memory/fb_pool.hxx"

#include <gtest/gtest.h>

#include <array>

using std::string_view_literals::operator""sv;

class Serializer : public testing::Test {
	const ScopeFbPoolInit fb_pool_init;
};

TEST_F(Serializer, String)
{
	SSH::Serializer s;
	s.WriteString("nistp256"sv);

	const auto result = s.Finish();
	ASSERT_EQ(result.size(), 12U);
	EXPECT_EQ(result[0], std::byte{});
	EXPECT_EQ(result[1], std::byte{});
	EXPECT_EQ(result[2], std::byte{});
	EXPECT_EQ(result[3], std::byte{8});
	EXPECT_EQ(ToStringView(result.subspan(4)), "nistp256"sv);
}

TEST_F(Serializer, EmptyString)
{
	SSH::Serializer s;
	s.WriteString({});

	const auto result = s.Finish();
	ASSERT_EQ(result.size(), 4U);
	for (const auto i : result)
		EXPECT_EQ(i, std::byte{});
}

TEST_F(Serializer, PrepareLength)
{
	static constexpr std::array data{std::byte{1}, std::byte{2}, std::byte{3}};

	SSH::Serializer s;
	const auto length = s.PrepareLength();
	s.WriteN(data);
	s.CommitLength(length);

	SSH::Deserializer d{s.Finish()};
	const auto payload = d.ReadLengthEncoded();
	d.ExpectEnd();
	ASSERT_EQ(payload.size(), data.size());
	EXPECT_TRUE(std::equal(payload.begin(), payload.end(), data.begin()));
}

TEST_F(Serializer, Overflow)
{
	SSH::Serializer s;
	EXPECT_THROW(s.WriteN(SSH::MAX_PACKET_SIZE + 1), SSH::SerializeOverflow);
	EXPECT_TRUE(s.Finish().empty());

	s.WriteN(SSH::MAX_PACKET_SIZE - 2);
	EXPECT_THROW(s.WriteString("foo"sv), SSH::SerializeOverflow);
	EXPECT_EQ(s.Finish().size(), SSH::MAX_PACKET_SIZE - 2);
}

TEST_F(Serializer, Truncated)
{
	static constexpr std::array data{std::byte{}, std::byte{}, std::byte{}, std::byte{4}, std::byte{'x'}};

	SSH::Deserializer d{data};
	EXPECT_THROW(d.ReadString(), SSH::MalformedPacket);
}

static void
CommitBignum2(SSH::Serializer &s, std::span<const std::byte> src)
{
	auto dest = s.BeginWriteN(src.size());
	std::copy(src.begin(), src.end(), dest.begin());
	s.CommitBignum2(dest.size());
}

TEST_F(Serializer, Bignum2Zero)
{
	static constexpr std::array data{std::byte{}, std::byte{}};

	SSH::Serializer s;
	CommitBignum2(s, data);
	EXPECT_TRUE(s.Finish().empty());
}

TEST_F(Serializer, Bignum2LeadingZeroes)
{
	static constexpr std::array data{std::byte{}, std::byte{}, std::byte{42}, std::byte{0xff}};

	SSH::Serializer s;
	CommitBignum2(s, data);

	const auto result = s.Finish();
	ASSERT_EQ(result.size(), 2U);
	EXPECT_EQ(result[0], std::byte{42});
	EXPECT_EQ(result[1], std::byte{0xff});
}

TEST_F(Serializer, Bignum2HighBit)
{
	static constexpr std::array data{std::byte{0x80}, std::byte{42}};

	SSH::Serializer s;
	CommitBignum2(s, data);

	const auto result = s.Finish();
	ASSERT_EQ(result.size(), 3U);
	/* must have inserted a null byte */
	EXPECT_EQ(result[0], std::byte{});
	EXPECT_EQ(result[1], std::byte{0x80});
	EXPECT_EQ(result[2], std::byte{42});
}

TEST_F(Serializer, Bignum2HighBitAfterZero)
{
	static constexpr std::array data{std::byte{}, std::byte{}, std::byte{0xc0}};

	SSH::Serializer s;
	CommitBignum2(s, data);

	const auto result = s.Finish();
	ASSERT_EQ(result.size(), 2U);
	EXPECT_EQ(result[0], std::byte{});
	EXPECT_EQ(result[1], std::byte{0xc0});
}

TEST_F(Serializer, Bignum2HighBitOverflow)
{
	static constexpr std::array data{std::byte{0x80}, std::byte{42}};

	/* the inserted null byte does not fit */
	SSH::Serializer s;
	s.WriteN(SSH::MAX_PACKET_SIZE - data.size());
	EXPECT_THROW(CommitBignum2(s, data), SSH::SerializeOverflow);
}
