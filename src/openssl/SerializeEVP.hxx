// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include "util/AllocatedArray.hxx"

#include <openssl/evp.h>

#include <cstddef>

/**
 * Encode the public point of an EC key as uncompressed SEC1 octet
 * string ("0x04 || X || Y", each coordinate padded to the field
 * size).  Unlike #OSSL_PKEY_PARAM_PUB_KEY, this does not depend on
 * the key's point conversion format.
 *
 * Throws #SslError on error.
 */
AllocatedArray<std::byte>
GetUncompressedPublicKey(const EVP_PKEY &key);
