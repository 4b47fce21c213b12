// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "key/ECDSABlob.hxx"
#include "key/ECDSAKey.hxx"
#include "key/Error.hxx"
#include "key/Format.hxx"
#include "ssh/Serializer.hxx"
#include "ssh/Deserializer.hxx"
#include "memory/fb_pool.hxx"
#include "util/SpanCast.hxx"

#include <gtest/gtest.h>

#include <algorithm>

using std::string_view_literals::operator""sv;

static constexpr uint8_t test_q[] = {
	0x04, 0xab, 0x5c, 0x2b, 0xcd, 0x9c, 0x12, 0x8a, 0xa3, 0x89, 0x7c, 0xaa, 0x3e, 0x9c, 0x90,
	0x02, 0x59, 0x0e, 0x41, 0x8b, 0x3c, 0x2c, 0xbe, 0x5d, 0x0d, 0xa8, 0x4f, 0x6a, 0x1e, 0x5d,
	0xaa, 0x86, 0x89, 0x7d, 0x51, 0xdc, 0x29, 0x2e, 0x42, 0x25, 0x80, 0x57, 0xd0, 0xec, 0x3e,
	0x0e, 0x58, 0xfd, 0xc4, 0xab, 0x52, 0x41, 0x10, 0xb2, 0x25, 0x73, 0x82, 0x12, 0xd2, 0x71,
	0xfa, 0x4e, 0x0b, 0x51, 0x5d,
};

class ECDSABlob : public testing::Test {
	const ScopeFbPoolInit fb_pool_init;
};

TEST_F(ECDSABlob, FromPoint)
{
	const auto q = std::as_bytes(std::span{test_q});

	SSH::Serializer s;
	SerializeECDSAPublicKey(s, ECDSACurve::NISTP256, q);

	SSH::Deserializer d{s.Finish()};
	EXPECT_EQ(d.ReadString(), "ecdsa-sha2-nistp256"sv);
	EXPECT_EQ(d.ReadString(), "nistp256"sv);
	const auto blob_q = d.ReadLengthEncoded();
	d.ExpectEnd();

	EXPECT_TRUE(std::equal(blob_q.begin(), blob_q.end(), q.begin(), q.end()));

	/* same bytes as the key object produces */
	const ECDSAPublicKey key{ECDSACurve::NISTP256, q};
	const auto key_blob = GetPublicKeyBlob(key);
	const auto result = s.Finish();
	EXPECT_TRUE(std::equal(result.begin(), result.end(),
			       key_blob.data(), key_blob.data() + key_blob.size()));
}

TEST_F(ECDSABlob, PointSize)
{
	EXPECT_EQ(GetPointSize(ECDSACurve::NISTP256), 65U);
	EXPECT_EQ(GetPointSize(ECDSACurve::NISTP384), 97U);
	EXPECT_EQ(GetPointSize(ECDSACurve::NISTP521), 133U);

	for (const auto curve : all_ecdsa_curves) {
		const ECDSAKeyPair key{ECDSAKeyPair::Generate{}, curve};
		const auto blob = GetPublicKeyBlob(key);

		SSH::Deserializer d{std::span{blob.data(), blob.size()}};
		d.ReadString();
		d.ReadString();
		const auto q = d.ReadLengthEncoded();
		d.ExpectEnd();

		ASSERT_EQ(q.size(), GetPointSize(curve));
		EXPECT_EQ(q.front(), std::byte{0x04});
	}
}

TEST_F(ECDSABlob, RejectCompressedPoint)
{
	/* the X coordinate of test_q with the "odd Y" prefix */
	uint8_t compressed[33];
	std::copy_n(test_q + 1, 32, compressed + 1);
	compressed[0] = 0x03;

	SSH::Serializer s;
	EXPECT_THROW(SerializeECDSAPublicKey(s, ECDSACurve::NISTP256,
					     std::as_bytes(std::span{compressed})),
		     EncodingError);
	EXPECT_TRUE(s.Finish().empty());
}

TEST_F(ECDSABlob, RejectWrongSize)
{
	const auto q = std::as_bytes(std::span{test_q});

	SSH::Serializer s;
	EXPECT_THROW(SerializeECDSAPublicKey(s, ECDSACurve::NISTP384, q),
		     EncodingError);
	EXPECT_THROW(SerializeECDSAPublicKey(s, ECDSACurve::NISTP256, q.first(64)),
		     EncodingError);
	EXPECT_THROW(SerializeECDSAPublicKey(s, ECDSACurve::NISTP256, {}),
		     EncodingError);
}

TEST_F(ECDSABlob, Overflow)
{
	SSH::Serializer s;
	s.WriteN(SSH::MAX_PACKET_SIZE - 16);

	EXPECT_THROW(SerializeECDSAPublicKey(s, ECDSACurve::NISTP256,
					     std::as_bytes(std::span{test_q})),
		     EncodingError);

	const ECDSAKeyPair key{ECDSAKeyPair::Generate{}, ECDSACurve::NISTP521};
	EXPECT_THROW(key.SerializePublic(s), EncodingError);
	EXPECT_THROW(key.ClonePublicKey().SerializePublic(s), EncodingError);
}
