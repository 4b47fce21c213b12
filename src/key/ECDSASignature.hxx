// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "ECDSACurve.hxx"
#include "util/AllocatedArray.hxx"

#include <cstddef>
#include <span>

namespace SSH { class Serializer; }

/**
 * Convert a DER-encoded "ECDSA-Sig-Value" (as generated by
 * ECDSAKeyPair::Sign()) to the SSH signature blob format.
 *
 * Throws #InvalidFormatError if the DER signature is malformed and
 * #EncodingError if the blob does not fit into the #Serializer.
 *
 * @see https://datatracker.ietf.org/doc/html/rfc5656#section-3.1.2
 */
void
SerializeECDSASignature(SSH::Serializer &s, ECDSACurve curve,
			std::span<const std::byte> der);

/**
 * Parse a SSH signature blob and convert it to a DER-encoded
 * "ECDSA-Sig-Value" which can be passed to ECDSAPublicKey::Verify().
 *
 * Throws #InvalidFormatError if the blob is malformed or if the
 * algorithm does not match the curve.
 */
AllocatedArray<std::byte>
DeserializeECDSASignature(ECDSACurve curve, std::span<const std::byte> src);
