// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include "util/AllocatedArray.hxx"

#include <cstddef>
#include <string>

class PublicKey;

/**
 * Serialize the public key blob into a newly allocated buffer.
 */
AllocatedArray<std::byte>
GetPublicKeyBlob(const PublicKey &key);

/**
 * Format the public key in the OpenSSH text form: the key type, a
 * space and the base64-encoded blob.
 */
std::string
ToString(const PublicKey &key);
