// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "lib/openssl/UniqueEVP.hxx"

#include <cstddef>
#include <span>
#include <string_view>

/**
 * Import an EC public key from an encoded point.
 *
 * @param curve_name the OpenSSL group name, e.g. "P-256"
 * @param q the encoded public point (SEC1 octet string)
 */
UniqueEVP_PKEY
DeserializeECPublic(std::string_view curve_name, std::span<const std::byte> q);

/**
 * Import an EC key pair from an encoded point and a big-endian
 * private scalar.
 */
UniqueEVP_PKEY
DeserializeEC(std::string_view curve_name, std::span<const std::byte> q,
	      std::span<const std::byte> d);
