// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include <cstddef>
#include <span>
#include <string_view>

namespace SSH { class Serializer; }

/**
 * The operations available on every key, whether or not it has a
 * secret part.
 */
class PublicKey {
public:
	PublicKey() noexcept = default;
	virtual ~PublicKey() noexcept = default;

	PublicKey(const PublicKey &) = delete;
	PublicKey &operator=(const PublicKey &) = delete;

	/**
	 * @return the key size in bits
	 */
	virtual unsigned GetSize() const noexcept = 0;

	/**
	 * @return the SSH key type name
	 */
	virtual std::string_view GetType() const noexcept = 0;

	/**
	 * Write the SSH public key blob.
	 */
	virtual void SerializePublic(SSH::Serializer &s) const = 0;

	/**
	 * @return true if the signature is valid, false if it does
	 * not match
	 */
	virtual bool Verify(std::span<const std::byte> message,
			    std::span<const std::byte> signature) const = 0;
};

/**
 * The signing capability of a key which has a secret part.
 */
class SecretKey {
public:
	SecretKey() noexcept = default;
	virtual ~SecretKey() noexcept = default;

	SecretKey(const SecretKey &) = delete;
	SecretKey &operator=(const SecretKey &) = delete;

	virtual void Sign(SSH::Serializer &s,
			  std::span<const std::byte> src) const = 0;
};
