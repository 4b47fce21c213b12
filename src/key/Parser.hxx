// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "ECDSAKey.hxx"

#include <cstddef>
#include <span>
#include <string_view>

/**
 * Parse an ECDSA public key blob, the inverse of
 * ECDSAPublicKey::SerializePublic().
 *
 * Throws #UnsupportedCurveError if the algorithm is unknown and
 * #InvalidFormatError if the blob is malformed.
 */
ECDSAPublicKey
ParseECDSAPublicKeyBlob(std::span<const std::byte> src,
			ECDSAKeyOptions options={});

/**
 * Parse a public key in text form ("ecdsa-sha2-nistp256 AAAA...
 * [comment]"), as found in "*.pub" and "authorized_keys" files
 * (without options).
 */
ECDSAPublicKey
ParseECDSAPublicKeyLine(std::string_view line,
			ECDSAKeyOptions options={});
