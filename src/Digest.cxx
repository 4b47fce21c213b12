// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Digest.hxx"
#include "lib/sodium/SHA256.hxx"
#include "lib/sodium/SHA512.hxx"

#include <sha1.h>
#include <sha2.h>

struct DigestImplementation {
	std::size_t size;
	void (*calculate)(std::span<const std::byte> src,
			  std::byte *dest) noexcept;
};

static void
CalcSHA1(std::span<const std::byte> src, std::byte *dest) noexcept
{
	static_assert(DIGEST_MAX_SIZE >= SHA1_DIGEST_LENGTH);

	SHA1_CTX ctx;
	SHA1Init(&ctx);
	SHA1Update(&ctx, reinterpret_cast<const uint8_t *>(src.data()), src.size());
	SHA1Final(reinterpret_cast<uint8_t *>(dest), &ctx);
}

static void
CalcSHA256(std::span<const std::byte> src, std::byte *dest) noexcept
{
	static_assert(DIGEST_MAX_SIZE >= crypto_hash_sha256_BYTES);

	SHA256State state;
	state.Update(src);
	state.Final(std::span<std::byte, crypto_hash_sha256_BYTES>{dest, crypto_hash_sha256_BYTES});
}

static void
CalcSHA384(std::span<const std::byte> src, std::byte *dest) noexcept
{
	static_assert(DIGEST_MAX_SIZE >= SHA384_DIGEST_LENGTH);

	SHA2_CTX ctx;
	SHA384Init(&ctx);
	SHA384Update(&ctx, reinterpret_cast<const uint8_t *>(src.data()), src.size());
	SHA384Final(reinterpret_cast<uint8_t *>(dest), &ctx);
}

static void
CalcSHA512(std::span<const std::byte> src, std::byte *dest) noexcept
{
	static_assert(DIGEST_MAX_SIZE >= crypto_hash_sha512_BYTES);

	SHA512State state;
	state.Update(src);
	state.Final(std::span<std::byte, crypto_hash_sha512_BYTES>{dest, crypto_hash_sha512_BYTES});
}

/* indexed by DigestAlgorithm */
static constexpr DigestImplementation digest_implementations[] = {
	{
		SHA1_DIGEST_LENGTH,
		CalcSHA1,
	},
	{
		crypto_hash_sha256_BYTES,
		CalcSHA256,
	},
	{
		SHA384_DIGEST_LENGTH,
		CalcSHA384,
	},
	{
		crypto_hash_sha512_BYTES,
		CalcSHA512,
	},
};

static constexpr const DigestImplementation &
GetDigestImplementation(DigestAlgorithm a) noexcept
{
	return digest_implementations[static_cast<std::size_t>(a)];
}

std::size_t
DigestSize(DigestAlgorithm a) noexcept
{
	const auto &i = GetDigestImplementation(a);
	return i.size;
}

std::size_t
Digest(DigestAlgorithm a, std::span<const std::byte> src,
       std::byte *dest) noexcept
{
	const auto &i = GetDigestImplementation(a);
	i.calculate(src, dest);
	return i.size;
}
