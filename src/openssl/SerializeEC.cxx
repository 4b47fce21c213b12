// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "SerializeEC.hxx"
#include "lib/openssl/Error.hxx"
#include "util/ScopeExit.hxx"

AllocatedArray<std::byte>
ECPointToOctets(const EC_GROUP &g, const EC_POINT &v,
		point_conversion_form_t form)
{
	BN_CTX *const bn_ctx = BN_CTX_new();
	if (bn_ctx == nullptr)
		throw SslError{};

	AtScopeExit(bn_ctx) { BN_CTX_free(bn_ctx); };

	const std::size_t size = EC_POINT_point2oct(&g, &v, form, nullptr, 0, bn_ctx);
	if (size == 0)
		throw SslError{"EC_POINT_point2oct() failed"};

	AllocatedArray<std::byte> result{size};
	if (EC_POINT_point2oct(&g, &v, form,
			       reinterpret_cast<unsigned char *>(result.data()),
			       result.size(), bn_ctx) != size)
		throw SslError{"EC_POINT_point2oct() failed"};

	return result;
}
