// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "ECDSASignature.hxx"
#include "Error.hxx"
#include "ssh/Serializer.hxx"
#include "ssh/Deserializer.hxx"
#include "openssl/DeserializeBN.hxx"
#include "openssl/SerializeBN.hxx"
#include "lib/openssl/Error.hxx"
#include "lib/openssl/UniqueEC.hxx"
#include "util/ScopeExit.hxx"

#include <openssl/ec.h>

#include <exception>

void
SerializeECDSASignature(SSH::Serializer &s, ECDSACurve curve,
			std::span<const std::byte> der)
try {
	auto der_data = reinterpret_cast<const unsigned char *>(der.data());
	const UniqueECDSA_SIG esig{d2i_ECDSA_SIG(nullptr, &der_data, der.size())};
	if (esig == nullptr)
		throw InvalidFormatError{"Malformed DER signature"};

	const BIGNUM *sig_r, *sig_s;
	ECDSA_SIG_get0(esig.get(), &sig_r, &sig_s);

	s.WriteString(GetAlgorithmName(curve));

	const auto bn_length = s.PrepareLength();
	const auto r_length = s.PrepareLength();
	Serialize(s, *sig_r);
	s.CommitLength(r_length);
	const auto s_length = s.PrepareLength();
	Serialize(s, *sig_s);
	s.CommitLength(s_length);
	s.CommitLength(bn_length);
} catch (SSH::SerializeOverflow) {
	throw EncodingError{"ECDSA signature blob too large"};
} catch (const InvalidFormatError &) {
	throw;
} catch (const std::invalid_argument &) {
	// thrown by Serialize(BIGNUM) for negative or oversized r/s
	std::throw_with_nested(InvalidFormatError{"Malformed DER signature"});
}

static UniqueECDSA_SIG
DeserializeECDSA_SIG(std::span<const std::byte> src)
{
	SSH::Deserializer d{src};
	auto r = DeserializeBIGNUM(d.ReadLengthEncoded());
	auto s = DeserializeBIGNUM(d.ReadLengthEncoded());
	d.ExpectEnd();

	UniqueECDSA_SIG sig{ECDSA_SIG_new()};
	if (!sig)
		throw SslError{};

	if (!ECDSA_SIG_set0(sig.get(), r.get(), s.get()))
		throw SslError{};

	/* ownership has been transferred to the ECDSA_SIG */
	r.release();
	s.release();

	return sig;
}

AllocatedArray<std::byte>
DeserializeECDSASignature(ECDSACurve curve, std::span<const std::byte> src)
try {
	SSH::Deserializer d{src};
	if (d.ReadString() != GetAlgorithmName(curve))
		throw InvalidFormatError{"Wrong signature algorithm"};

	const auto sig = DeserializeECDSA_SIG(d.ReadLengthEncoded());
	d.ExpectEnd();

	unsigned char *data = nullptr;
	const int result = i2d_ECDSA_SIG(sig.get(), &data);
	if (result < 0)
		throw SslError{"i2d_ECDSA_SIG() failed"};

	AtScopeExit(data) { OPENSSL_free(data); };

	return AllocatedArray<std::byte>{std::span{reinterpret_cast<const std::byte *>(data),
						   static_cast<std::size_t>(result)}};
} catch (SSH::MalformedPacket) {
	throw InvalidFormatError{"Malformed ECDSA signature"};
} catch (const InvalidFormatError &) {
	throw;
} catch (const std::invalid_argument &) {
	// thrown by DeserializeBIGNUM()
	std::throw_with_nested(InvalidFormatError{"Malformed ECDSA signature"});
}
