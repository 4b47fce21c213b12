// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "Key.hxx"
#include "ECDSACurve.hxx"
#include "ECDSAOptions.hxx"
#include "lib/openssl/UniqueEVP.hxx"

#include <openssl/ec.h>

/**
 * An ECDSA public key on one of the NIST curves.  The point is owned
 * by an OpenSSL #EVP_PKEY.
 */
class ECDSAPublicKey final : public PublicKey {
	ECDSACurve curve;
	UniqueEVP_PKEY key;
	ECDSAKeyOptions options;

public:
	/**
	 * Throws #InvalidFormatError if the group is not a supported
	 * curve or if OpenSSL rejects the point.
	 */
	ECDSAPublicKey(const EC_GROUP &group, const EC_POINT &point,
		       ECDSAKeyOptions _options={});

	/**
	 * @param q the SEC1-encoded point
	 */
	ECDSAPublicKey(ECDSACurve _curve, std::span<const std::byte> q,
		       ECDSAKeyOptions _options={});

	/**
	 * Adopt an OpenSSL EC key.
	 */
	explicit ECDSAPublicKey(UniqueEVP_PKEY &&_key,
				ECDSAKeyOptions _options={});

	ECDSACurve GetCurve() const noexcept {
		return curve;
	}

	unsigned GetSize() const noexcept override;
	std::string_view GetType() const noexcept override;
	void SerializePublic(SSH::Serializer &s) const override;

	/**
	 * @param signature a DER-encoded "ECDSA-Sig-Value"
	 *
	 * Throws #CryptoError if the signature cannot be evaluated.
	 */
	bool Verify(std::span<const std::byte> message,
		    std::span<const std::byte> signature) const override;

	/**
	 * Two keys are equal if they are on the same curve (with
	 * identical group parameters) and have the same point.
	 */
	[[gnu::pure]]
	bool operator==(const ECDSAPublicKey &other) const noexcept;
};

class ECDSAKeyPair final : public PublicKey, public SecretKey {
	ECDSACurve curve;
	UniqueEVP_PKEY key;
	ECDSAKeyOptions options;

public:
	struct Generate {};
	ECDSAKeyPair(Generate, ECDSACurve _curve,
		     ECDSAKeyOptions _options={});

	/**
	 * Adopt an OpenSSL EC key which has a private key.
	 *
	 * Throws #InvalidFormatError if the curve is not supported
	 * or if the key pair is inconsistent.
	 */
	explicit ECDSAKeyPair(UniqueEVP_PKEY &&_key,
			      ECDSAKeyOptions _options={});

	/**
	 * Construct from raw key material (as found in the SSH agent
	 * protocol and in OpenSSH private key files).
	 *
	 * @param q the SEC1-encoded public point
	 * @param d the big-endian private scalar
	 */
	ECDSAKeyPair(ECDSACurve _curve,
		     std::span<const std::byte> q,
		     std::span<const std::byte> d,
		     ECDSAKeyOptions _options={});

	ECDSACurve GetCurve() const noexcept {
		return curve;
	}

	/**
	 * Throws #EncodingError if the public point cannot be
	 * obtained.
	 */
	ECDSAPublicKey ClonePublicKey() const;

	unsigned GetSize() const noexcept override;
	std::string_view GetType() const noexcept override;
	void SerializePublic(SSH::Serializer &s) const override;
	bool Verify(std::span<const std::byte> message,
		    std::span<const std::byte> signature) const override;

	/**
	 * Write a DER-encoded "ECDSA-Sig-Value".
	 *
	 * Throws #CryptoError on error, including a #Serializer
	 * without enough room for the signature.
	 */
	void Sign(SSH::Serializer &s,
		  std::span<const std::byte> src) const override;
};
