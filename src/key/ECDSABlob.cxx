// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "ECDSABlob.hxx"
#include "Error.hxx"
#include "ssh/Serializer.hxx"
#include "openssl/SerializeEVP.hxx"
#include "lib/openssl/Error.hxx"

#include <exception>

void
SerializeECDSAPublicKey(SSH::Serializer &s, ECDSACurve curve,
			std::span<const std::byte> q)
try {
	if (q.size() != GetPointSize(curve) ||
	    q.front() != std::byte{POINT_CONVERSION_UNCOMPRESSED})
		throw EncodingError{"Not an uncompressed ECDSA point"};

	s.WriteString(GetAlgorithmName(curve));
	s.WriteString(GetIdentifier(curve));
	s.WriteLengthEncoded(q);
} catch (SSH::SerializeOverflow) {
	throw EncodingError{"ECDSA public key blob too large"};
}

void
SerializeECDSAPublicKey(SSH::Serializer &s, ECDSACurve curve,
			const EVP_PKEY &key)
{
	AllocatedArray<std::byte> q;

	try {
		q = GetUncompressedPublicKey(key);
	} catch (const SslError &) {
		std::throw_with_nested(EncodingError{"Failed to obtain ECDSA public key"});
	}

	SerializeECDSAPublicKey(s, curve, std::span{q.data(), q.size()});
}
