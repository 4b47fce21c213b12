// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "../Digest.hxx"

#include <openssl/evp.h>

[[gnu::const]]
inline const EVP_MD *
ToEvpMD(DigestAlgorithm a) noexcept
{
	switch (a) {
	case DigestAlgorithm::SHA1:
		return EVP_sha1();

	case DigestAlgorithm::SHA256:
		return EVP_sha256();

	case DigestAlgorithm::SHA384:
		return EVP_sha384();

	case DigestAlgorithm::SHA512:
		return EVP_sha512();
	}

	return nullptr;
}
