// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "../Digest.hxx"

#include <openssl/evp.h>

#include <cstddef>
#include <span>

namespace SSH { class Serializer; }

/**
 * Calculate the digest of the given message and sign it.  The
 * provider-native signature (for ECDSA: a DER-encoded
 * "ECDSA-Sig-Value") is written to the #Serializer without any
 * framing.
 */
void
SignGeneric(SSH::Serializer &s,
	    EVP_PKEY &key, DigestAlgorithm hash_alg,
	    std::span<const std::byte> src);
