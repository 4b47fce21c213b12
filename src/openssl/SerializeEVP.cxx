// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "SerializeEVP.hxx"
#include "EVP.hxx"
#include "lib/openssl/Error.hxx"

#include <openssl/core_names.h>
#include <openssl/ec.h>

static void
WriteCoordinate(std::byte *dest, std::size_t size, const BIGNUM &bn)
{
	if (BN_bn2binpad(&bn, reinterpret_cast<unsigned char *>(dest), size) != int(size))
		throw SslError{"BN_bn2binpad() failed"};
}

AllocatedArray<std::byte>
GetUncompressedPublicKey(const EVP_PKEY &key)
{
	const int bits = EVP_PKEY_get_bits(&key);
	if (bits <= 0)
		throw SslError{"EVP_PKEY_get_bits() failed"};

	const std::size_t coordinate_size = (std::size_t(bits) + 7) / 8;

	const auto x = GetBNParam<false>(key, OSSL_PKEY_PARAM_EC_PUB_X);
	const auto y = GetBNParam<false>(key, OSSL_PKEY_PARAM_EC_PUB_Y);

	AllocatedArray<std::byte> result{1 + 2 * coordinate_size};
	result[0] = std::byte{POINT_CONVERSION_UNCOMPRESSED};
	WriteCoordinate(result.data() + 1, coordinate_size, *x);
	WriteCoordinate(result.data() + 1 + coordinate_size, coordinate_size, *y);
	return result;
}
