// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "Digest.hxx"

#include <openssl/ec.h>
#include <openssl/obj_mac.h>

#include <array>
#include <cstddef>
#include <string_view>

/**
 * The NIST curves supported for ECDSA keys (RFC 5656 section 10.1).
 */
enum class ECDSACurve {
	NISTP256,
	NISTP384,
	NISTP521,
};

static constexpr std::array all_ecdsa_curves{
	ECDSACurve::NISTP256,
	ECDSACurve::NISTP384,
	ECDSACurve::NISTP521,
};

/**
 * @return the curve size in bits
 */
[[gnu::const]]
constexpr unsigned
GetSize(ECDSACurve curve) noexcept
{
	switch (curve) {
	case ECDSACurve::NISTP256:
		return 256;

	case ECDSACurve::NISTP384:
		return 384;

	case ECDSACurve::NISTP521:
		return 521;
	}

	return 0;
}

/**
 * @return the size of an uncompressed SEC1 point ("0x04 || X ||
 * Y") in bytes
 */
[[gnu::const]]
constexpr std::size_t
GetPointSize(ECDSACurve curve) noexcept
{
	return 1 + 2 * ((GetSize(curve) + 7) / 8);
}

/**
 * @return the SSH public key algorithm name,
 * e.g. "ecdsa-sha2-nistp256"
 */
[[gnu::const]]
constexpr std::string_view
GetAlgorithmName(ECDSACurve curve) noexcept
{
	using std::string_view_literals::operator""sv;

	switch (curve) {
	case ECDSACurve::NISTP256:
		return "ecdsa-sha2-nistp256"sv;

	case ECDSACurve::NISTP384:
		return "ecdsa-sha2-nistp384"sv;

	case ECDSACurve::NISTP521:
		return "ecdsa-sha2-nistp521"sv;
	}

	return {};
}

/**
 * @return the SSH curve identifier, e.g. "nistp256"
 */
[[gnu::const]]
constexpr std::string_view
GetIdentifier(ECDSACurve curve) noexcept
{
	using std::string_view_literals::operator""sv;

	switch (curve) {
	case ECDSACurve::NISTP256:
		return "nistp256"sv;

	case ECDSACurve::NISTP384:
		return "nistp384"sv;

	case ECDSACurve::NISTP521:
		return "nistp521"sv;
	}

	return {};
}

[[gnu::const]]
constexpr int
GetNid(ECDSACurve curve) noexcept
{
	switch (curve) {
	case ECDSACurve::NISTP256:
		return NID_X9_62_prime256v1;

	case ECDSACurve::NISTP384:
		return NID_secp384r1;

	case ECDSACurve::NISTP521:
		return NID_secp521r1;
	}

	return NID_undef;
}

/**
 * @return the OpenSSL group name (a null-terminated string)
 */
[[gnu::const]]
constexpr const char *
GetOpenSSLName(ECDSACurve curve) noexcept
{
	switch (curve) {
	case ECDSACurve::NISTP256:
		return "P-256";

	case ECDSACurve::NISTP384:
		return "P-384";

	case ECDSACurve::NISTP521:
		return "P-521";
	}

	return nullptr;
}

/**
 * The digest algorithm RFC 5656 section 6.2.1 assigns to the curve.
 */
[[gnu::const]]
constexpr DigestAlgorithm
GetDigestAlgorithm(ECDSACurve curve) noexcept
{
	switch (curve) {
	case ECDSACurve::NISTP256:
		break;

	case ECDSACurve::NISTP384:
		return DigestAlgorithm::SHA384;

	case ECDSACurve::NISTP521:
		return DigestAlgorithm::SHA512;
	}

	return DigestAlgorithm::SHA256;
}

/**
 * Parse a SSH curve identifier such as "nistp256".  The comparison
 * is exact.
 *
 * Throws #UnsupportedCurveError on error.
 */
ECDSACurve
ParseECDSACurve(std::string_view s);

/**
 * Parse a SSH algorithm name such as "ecdsa-sha2-nistp256".
 *
 * Throws #UnsupportedCurveError on error.
 */
ECDSACurve
ParseECDSAAlgorithmName(std::string_view s);

/**
 * Throws #InvalidFormatError if the NID is not a supported curve.
 */
ECDSACurve
GetECDSACurveByNid(int nid);

/**
 * Look up a curve by its OpenSSL short name ("prime256v1") or its
 * NIST name ("P-256").
 *
 * Throws #InvalidFormatError if the name is not a supported curve.
 */
ECDSACurve
GetECDSACurveByName(const char *name);

/**
 * Determine the curve of an OpenSSL group.
 *
 * Throws #InvalidFormatError if the group has no curve name or if
 * the curve is not supported.
 */
ECDSACurve
GetECDSACurve(const EC_GROUP &group);
