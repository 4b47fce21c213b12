// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include <string>

class PublicKey;

/**
 * Calculate the OpenSSH-style SHA256 fingerprint of the public key
 * blob.  Errors are logged and result in the string "ERROR".
 */
std::string
GetFingerprint(const PublicKey &key) noexcept;
