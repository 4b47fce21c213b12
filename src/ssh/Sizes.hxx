// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include <cstddef>

namespace SSH {

/**
 * The capacity of one #Serializer buffer.  This is the SSH packet
 * size limit, which is far more than any key blob or signature
 * needs.
 */
static constexpr std::size_t MAX_PACKET_SIZE = 35000;

} // namespace SSH
