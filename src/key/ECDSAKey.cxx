// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "ECDSAKey.hxx"
#include "ECDSABlob.hxx"
#include "Error.hxx"
#include "ssh/Serializer.hxx"
#include "openssl/DeserializeEC.hxx"
#include "openssl/EVP.hxx"
#include "openssl/SerializeEC.hxx"
#include "openssl/SerializeEVP.hxx"
#include "openssl/Sign.hxx"
#include "openssl/Verify.hxx"
#include "lib/openssl/Error.hxx"

#include <openssl/core_names.h> // for OSSL_PKEY_PARAM_GROUP_NAME

#include <exception>

static ECDSACurve
GetKeyCurve(const EVP_PKEY &key)
try {
	if (!EVP_PKEY_is_a(&key, "EC"))
		throw InvalidFormatError{"Not an EC key"};

	return GetECDSACurveByName(GetStringParam(key, OSSL_PKEY_PARAM_GROUP_NAME).get());
} catch (const SslError &) {
	std::throw_with_nested(InvalidFormatError{"EC key has no group name"});
}

static UniqueEVP_PKEY
ImportPublicKey(ECDSACurve curve, std::span<const std::byte> q)
try {
	return DeserializeECPublic(GetOpenSSLName(curve), q);
} catch (const SslError &) {
	std::throw_with_nested(InvalidFormatError{"Invalid ECDSA public key"});
}

static UniqueEVP_PKEY
ImportPublicKey(ECDSACurve curve,
		const EC_GROUP &group, const EC_POINT &point)
try {
	const auto q = ECPointToOctets(group, point);
	return ImportPublicKey(curve, std::span{q.data(), q.size()});
} catch (const SslError &) {
	std::throw_with_nested(InvalidFormatError{"Invalid ECDSA public key"});
}

static UniqueEVP_PKEY
ImportKeyPair(ECDSACurve curve,
	      std::span<const std::byte> q, std::span<const std::byte> d)
try {
	return DeserializeEC(GetOpenSSLName(curve), q, d);
} catch (const SslError &) {
	std::throw_with_nested(InvalidFormatError{"Invalid ECDSA key pair"});
} catch (const std::invalid_argument &) {
	// thrown by DeserializeBIGNUM()
	std::throw_with_nested(InvalidFormatError{"Invalid ECDSA private key"});
}

/**
 * Verify that the private scalar matches the public point.
 */
static void
CheckKeyPair(EVP_PKEY &key)
{
	const UniqueEVP_PKEY_CTX ctx{EVP_PKEY_CTX_new(&key, nullptr)};
	if (!ctx)
		throw SslError{"EVP_PKEY_CTX_new() failed"};

	if (EVP_PKEY_pairwise_check(ctx.get()) != 1)
		throw InvalidFormatError{"Inconsistent ECDSA key pair"};
}

static UniqueEVP_PKEY
GenerateECDSAKey(ECDSACurve curve)
{
	UniqueEVP_PKEY key{EVP_EC_gen(GetOpenSSLName(curve))};
	if (!key)
		throw CryptoError{"Failed to generate ECDSA key"};

	return key;
}

ECDSAPublicKey::ECDSAPublicKey(const EC_GROUP &group, const EC_POINT &point,
			       ECDSAKeyOptions _options)
	:curve(GetECDSACurve(group)),
	 key(ImportPublicKey(curve, group, point)),
	 options(_options)
{
}

ECDSAPublicKey::ECDSAPublicKey(ECDSACurve _curve, std::span<const std::byte> q,
			       ECDSAKeyOptions _options)
	:curve(_curve),
	 key(ImportPublicKey(curve, q)),
	 options(_options)
{
}

ECDSAPublicKey::ECDSAPublicKey(UniqueEVP_PKEY &&_key, ECDSAKeyOptions _options)
	:curve(GetKeyCurve(*_key)),
	 key(std::move(_key)),
	 options(_options)
{
}

unsigned
ECDSAPublicKey::GetSize() const noexcept
{
	return ::GetSize(curve);
}

std::string_view
ECDSAPublicKey::GetType() const noexcept
{
	return GetAlgorithmName(curve);
}

void
ECDSAPublicKey::SerializePublic(SSH::Serializer &s) const
{
	SerializeECDSAPublicKey(s, curve, *key);
}

bool
ECDSAPublicKey::Verify(std::span<const std::byte> message,
		       std::span<const std::byte> signature) const
try {
	return VerifyGeneric(*key, GetDigestAlgorithm(curve, options.digest_policy),
			     message, signature);
} catch (const SslError &) {
	std::throw_with_nested(CryptoError{"Failed to verify ECDSA signature"});
}

bool
ECDSAPublicKey::operator==(const ECDSAPublicKey &other) const noexcept
{
	/* EVP_PKEY_eq() compares the group parameters and the point;
	   it returns a negative value if the keys cannot be
	   compared */
	return curve == other.curve &&
		EVP_PKEY_eq(key.get(), other.key.get()) == 1;
}

ECDSAKeyPair::ECDSAKeyPair(Generate, ECDSACurve _curve,
			   ECDSAKeyOptions _options)
	:curve(_curve),
	 key(GenerateECDSAKey(curve)),
	 options(_options)
{
}

ECDSAKeyPair::ECDSAKeyPair(UniqueEVP_PKEY &&_key, ECDSAKeyOptions _options)
	:curve(GetKeyCurve(*_key)),
	 key(std::move(_key)),
	 options(_options)
{
	CheckKeyPair(*key);
}

ECDSAKeyPair::ECDSAKeyPair(ECDSACurve _curve,
			   std::span<const std::byte> q,
			   std::span<const std::byte> d,
			   ECDSAKeyOptions _options)
	:curve(_curve),
	 key(ImportKeyPair(curve, q, d)),
	 options(_options)
{
	CheckKeyPair(*key);
}

ECDSAPublicKey
ECDSAKeyPair::ClonePublicKey() const
{
	AllocatedArray<std::byte> q;

	try {
		q = GetUncompressedPublicKey(*key);
	} catch (const SslError &) {
		std::throw_with_nested(EncodingError{"Failed to obtain ECDSA public key"});
	}

	return ECDSAPublicKey{curve, std::span{q.data(), q.size()}, options};
}

unsigned
ECDSAKeyPair::GetSize() const noexcept
{
	return ::GetSize(curve);
}

std::string_view
ECDSAKeyPair::GetType() const noexcept
{
	return GetAlgorithmName(curve);
}

void
ECDSAKeyPair::SerializePublic(SSH::Serializer &s) const
{
	SerializeECDSAPublicKey(s, curve, *key);
}

bool
ECDSAKeyPair::Verify(std::span<const std::byte> message,
		     std::span<const std::byte> signature) const
{
	return ClonePublicKey().Verify(message, signature);
}

void
ECDSAKeyPair::Sign(SSH::Serializer &s, std::span<const std::byte> src) const
try {
	SignGeneric(s, *key, GetDigestAlgorithm(curve, options.digest_policy), src);
} catch (const SslError &) {
	std::throw_with_nested(CryptoError{"Failed to create ECDSA signature"});
} catch (SSH::SerializeOverflow) {
	throw CryptoError{"ECDSA signature too large"};
}
