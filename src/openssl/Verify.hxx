// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "../Digest.hxx"

#include <openssl/evp.h>

#include <cstddef>
#include <span>

/**
 * Calculate the digest of the given message and verify the
 * provider-native signature against it.
 *
 * @return true if the signature is valid, false if OpenSSL reports
 * a mismatch
 *
 * Throws #SslError if the signature could not be evaluated at all
 * (e.g. malformed DER).
 */
bool
VerifyGeneric(EVP_PKEY &key, DigestAlgorithm hash_alg,
	      std::span<const std::byte> message,
	      std::span<const std::byte> signature);
