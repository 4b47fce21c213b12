// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "ECDSACurve.hxx"

#include <openssl/evp.h>

#include <cstddef>
#include <span>

namespace SSH { class Serializer; }

/**
 * Write an ECDSA public key blob (RFC 5656 section 3.1): the
 * algorithm name, the curve identifier and the encoded point #q,
 * each as SSH "string".
 *
 * Throws #EncodingError if #q is not an uncompressed point of the
 * curve's size or if the blob does not fit into the #Serializer.
 */
void
SerializeECDSAPublicKey(SSH::Serializer &s, ECDSACurve curve,
			std::span<const std::byte> q);

/**
 * Like above, but obtain the point from an OpenSSL key, always in
 * uncompressed form.
 *
 * Throws #EncodingError on error.
 */
void
SerializeECDSAPublicKey(SSH::Serializer &s, ECDSACurve curve,
			const EVP_PKEY &key);
