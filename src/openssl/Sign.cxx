// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Sign.hxx"
#include "Digest.hxx"
#include "ssh/Serializer.hxx"
#include "lib/openssl/Error.hxx"
#include "lib/openssl/UniqueEVP.hxx"
#include "util/ScopeExit.hxx"

#include <sodium/utils.h>

#include <stdexcept>

static void
SignDigestOpenSSL(SSH::Serializer &s,
		  EVP_PKEY_CTX &ctx, std::span<const std::byte> digest)
{
	size_t length;
	if (EVP_PKEY_sign(&ctx, nullptr, &length,
			  reinterpret_cast<const unsigned char *>(digest.data()),
			  digest.size()) <= 0)
		throw SslError{"EVP_PKEY_sign() failed"};

	/* "length" is only an upper bound; the actual DER signature
	   may be shorter */
	auto dest = s.BeginWriteN(length);
	if (EVP_PKEY_sign(&ctx,
			  reinterpret_cast<unsigned char *>(dest.data()), &length,
			  reinterpret_cast<const unsigned char *>(digest.data()),
			  digest.size()) <= 0)
		throw SslError{"EVP_PKEY_sign() failed"};

	s.CommitWriteN(length);
}

static void
SignDigestOpenSSL(SSH::Serializer &s,
		  EVP_PKEY &key, const EVP_MD &md,
		  std::span<const std::byte> digest)
{
	const UniqueEVP_PKEY_CTX ctx(EVP_PKEY_CTX_new(&key, nullptr));
	if (!ctx)
		throw SslError("EVP_PKEY_CTX_new() failed");

	if (EVP_PKEY_sign_init(ctx.get()) <= 0)
		throw SslError("EVP_PKEY_sign_init() failed");

	if (EVP_PKEY_CTX_set_signature_md(ctx.get(), &md) <= 0)
		throw SslError("EVP_PKEY_CTX_set_signature_md() failed");

	SignDigestOpenSSL(s, *ctx, digest);
}

void
SignGeneric(SSH::Serializer &s,
	    EVP_PKEY &key, DigestAlgorithm hash_alg,
	    std::span<const std::byte> src)
{
	const auto *const md = ToEvpMD(hash_alg);
	if (md == nullptr)
		throw std::invalid_argument{"Digest algorithm not supported by OpenSSL"};

	std::byte digest_buffer[DIGEST_MAX_SIZE];
	Digest(hash_alg, src, digest_buffer);
	AtScopeExit(&digest_buffer) { sodium_memzero(digest_buffer, sizeof(digest_buffer)); };

	const std::span digest{digest_buffer, DigestSize(hash_alg)};
	SignDigestOpenSSL(s, key, *md, digest);
}
