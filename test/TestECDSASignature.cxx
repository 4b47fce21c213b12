// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "key/ECDSASignature.hxx"
#include "key/ECDSAKey.hxx"
#include "key/Error.hxx"
#include "ssh/Serializer.hxx"
#include "ssh/Deserializer.hxx"
#include "memory/fb_pool.hxx"
#include "util/AllocatedArray.hxx"
#include "util/SpanCast.hxx"

#include <gtest/gtest.h>

using std::string_view_literals::operator""sv;

class ECDSASignature : public testing::Test {
	const ScopeFbPoolInit fb_pool_init;
};

static AllocatedArray<std::byte>
SignSSH(const ECDSAKeyPair &key, std::span<const std::byte> message)
{
	AllocatedArray<std::byte> der;

	{
		SSH::Serializer s;
		key.Sign(s, message);
		der = AllocatedArray<std::byte>{s.Finish()};
	}

	SSH::Serializer s;
	SerializeECDSASignature(s, key.GetCurve(), der);
	return AllocatedArray<std::byte>{s.Finish()};
}

TEST_F(ECDSASignature, RoundTrip)
{
	const auto message = AsBytes("Hello world"sv);

	for (const auto curve : all_ecdsa_curves) {
		const ECDSAKeyPair key{ECDSAKeyPair::Generate{}, curve};
		const auto blob = SignSSH(key, message);

		SSH::Deserializer d{blob};
		EXPECT_EQ(d.ReadString(), GetAlgorithmName(curve));

		/* r and s are mpints inside a string */
		SSH::Deserializer bn{d.ReadLengthEncoded()};
		const auto r = bn.ReadLengthEncoded();
		const auto s = bn.ReadLengthEncoded();
		bn.ExpectEnd();
		d.ExpectEnd();

		EXPECT_FALSE(r.empty());
		EXPECT_FALSE(s.empty());
		EXPECT_LE(r.size(), (GetSize(curve) + 7) / 8 + 1);
		EXPECT_LE(s.size(), (GetSize(curve) + 7) / 8 + 1);

		const auto der = DeserializeECDSASignature(curve, blob);
		EXPECT_TRUE(key.ClonePublicKey().Verify(message, der));
		EXPECT_FALSE(key.ClonePublicKey().Verify(AsBytes("Hello World"sv), der));
	}
}

TEST_F(ECDSASignature, WrongAlgorithm)
{
	const ECDSAKeyPair key{ECDSAKeyPair::Generate{}, ECDSACurve::NISTP384};
	const auto blob = SignSSH(key, AsBytes("Hello world"sv));

	EXPECT_THROW(DeserializeECDSASignature(ECDSACurve::NISTP256, blob),
		     InvalidFormatError);
}

TEST_F(ECDSASignature, Malformed)
{
	EXPECT_THROW(DeserializeECDSASignature(ECDSACurve::NISTP256, {}),
		     InvalidFormatError);

	SSH::Serializer s;
	s.WriteString("ecdsa-sha2-nistp256"sv);
	s.WriteString("garbage"sv);
	EXPECT_THROW(DeserializeECDSASignature(ECDSACurve::NISTP256, s.Finish()),
		     InvalidFormatError);

	EXPECT_THROW(SerializeECDSASignature(s, ECDSACurve::NISTP256,
					     AsBytes("not a signature"sv)),
		     InvalidFormatError);
}

TEST_F(ECDSASignature, Overflow)
{
	const ECDSAKeyPair key{ECDSAKeyPair::Generate{}, ECDSACurve::NISTP384};

	AllocatedArray<std::byte> der;

	{
		SSH::Serializer s;
		key.Sign(s, AsBytes("Hello world"sv));
		der = AllocatedArray<std::byte>{s.Finish()};
	}

	/* room for the algorithm name, but not for r and s */
	SSH::Serializer s;
	s.WriteN(SSH::MAX_PACKET_SIZE - 40);
	EXPECT_THROW(SerializeECDSASignature(s, ECDSACurve::NISTP384, der),
		     EncodingError);
}
