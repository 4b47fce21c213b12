// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "ECDSAOptions.hxx"

#include <stdexcept>

using std::string_view_literals::operator""sv;

ECDSADigestPolicy
ParseECDSADigestPolicy(std::string_view s)
{
	if (s == "sha1"sv)
		return ECDSADigestPolicy::LEGACY_SHA1;
	else if (s == "curve"sv)
		return ECDSADigestPolicy::CURVE_SIZE;
	else
		throw std::invalid_argument{"Unknown ECDSA digest policy"};
}
