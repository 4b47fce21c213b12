// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "ECDSACurve.hxx"

#include <string_view>

/**
 * Which digest is applied to the message before it is signed or
 * verified.
 */
enum class ECDSADigestPolicy {
	/**
	 * SHA-1 for all curves.  This is what our existing peers
	 * expect.
	 */
	LEGACY_SHA1,

	/**
	 * SHA-256/384/512 depending on the curve size (RFC 5656
	 * section 6.2.1).
	 */
	CURVE_SIZE,
};

struct ECDSAKeyOptions {
	ECDSADigestPolicy digest_policy = ECDSADigestPolicy::LEGACY_SHA1;
};

[[gnu::const]]
constexpr DigestAlgorithm
GetDigestAlgorithm(ECDSACurve curve, ECDSADigestPolicy policy) noexcept
{
	switch (policy) {
	case ECDSADigestPolicy::LEGACY_SHA1:
		break;

	case ECDSADigestPolicy::CURVE_SIZE:
		return GetDigestAlgorithm(curve);
	}

	return DigestAlgorithm::SHA1;
}

/**
 * Parse a digest policy from a configuration value: "sha1" or
 * "curve".
 *
 * Throws std::invalid_argument on error.
 */
ECDSADigestPolicy
ParseECDSADigestPolicy(std::string_view s);
