// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "DeserializeEC.hxx"
#include "DeserializeBN.hxx"
#include "lib/openssl/Error.hxx"
#include "lib/openssl/UniqueBN.hxx"
#include "util/ScopeExit.hxx"

#include <openssl/core_names.h> // for OSSL_PKEY_PARAM_*
#include <openssl/param_build.h>

static OSSL_PARAM *
ToParam(std::string_view curve_name,
	std::span<const std::byte> q, const BIGNUM *d)
{
	OSSL_PARAM_BLD *const bld = OSSL_PARAM_BLD_new();
	if (bld == nullptr)
		throw SslError{};

	AtScopeExit(bld) { OSSL_PARAM_BLD_free(bld); };

	if (!OSSL_PARAM_BLD_push_utf8_string(bld, OSSL_PKEY_PARAM_GROUP_NAME,
					     curve_name.data(), curve_name.size()) ||
	    !OSSL_PARAM_BLD_push_octet_string(bld, OSSL_PKEY_PARAM_PUB_KEY,
					      q.data(), q.size()) ||
	    /* always export the public key uncompressed, even if
	       it was imported in compressed form */
	    !OSSL_PARAM_BLD_push_utf8_string(bld, OSSL_PKEY_PARAM_EC_POINT_CONVERSION_FORMAT,
					     OSSL_PKEY_EC_POINT_CONVERSION_FORMAT_UNCOMPRESSED, 0))
		throw SslError{};

	if (d != nullptr && !OSSL_PARAM_BLD_push_BN(bld, OSSL_PKEY_PARAM_PRIV_KEY, d))
		throw SslError{};

	OSSL_PARAM *param = OSSL_PARAM_BLD_to_param(bld);
	if (param == nullptr)
		throw SslError{};

	return param;
}

static UniqueEVP_PKEY
FromParam(const OSSL_PARAM *param, int selection)
{
	const UniqueEVP_PKEY_CTX ctx{EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr)};
	if (!ctx)
		throw SslError{"EVP_PKEY_CTX_new_from_name() failed"};

	if (EVP_PKEY_fromdata_init(ctx.get()) != 1)
		throw SslError{"EVP_PKEY_fromdata_init() failed"};

	EVP_PKEY *pkey = nullptr;
	if (EVP_PKEY_fromdata(ctx.get(), &pkey, selection,
			      const_cast<OSSL_PARAM *>(param)) != 1)
		throw SslError{"EVP_PKEY_fromdata() failed"};

	return UniqueEVP_PKEY{pkey};
}

UniqueEVP_PKEY
DeserializeECPublic(std::string_view curve_name, std::span<const std::byte> q)
{
	OSSL_PARAM *param = ToParam(curve_name, q, nullptr);
	AtScopeExit(param) { OSSL_PARAM_free(param); };

	return FromParam(param, EVP_PKEY_PUBLIC_KEY);
}

UniqueEVP_PKEY
DeserializeEC(std::string_view curve_name, std::span<const std::byte> q,
	      std::span<const std::byte> d)
{
	OSSL_PARAM *param = ToParam(curve_name, q, DeserializeBIGNUM(d).get());
	AtScopeExit(param) { OSSL_PARAM_free(param); };

	return FromParam(param, EVP_PKEY_KEYPAIR);
}
