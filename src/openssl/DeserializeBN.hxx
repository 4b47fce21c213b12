// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "lib/openssl/UniqueBN.hxx"

#include <cstddef>
#include <span>

/**
 * Convert the payload of a SSH "mpint" to a BIGNUM.
 *
 * Throws std::invalid_argument if the number is negative or too
 * large.
 */
UniqueBIGNUM<true>
DeserializeBIGNUM(std::span<const std::byte> src);
