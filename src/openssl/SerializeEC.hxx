// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "util/AllocatedArray.hxx"

#include <openssl/ec.h>

#include <cstddef>

/**
 * Encode an EC point as SEC1 octet string.  A #BN_CTX is allocated
 * for the duration of this call.
 */
AllocatedArray<std::byte>
ECPointToOctets(const EC_GROUP &g, const EC_POINT &v,
		point_conversion_form_t form=POINT_CONVERSION_UNCOMPRESSED);
