// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Fingerprint.hxx"
#include "Key.hxx"
#include "ssh/Serializer.hxx"
#include "lib/sodium/Base64.hxx"
#include "lib/sodium/SHA256.hxx"
#include "io/Logger.hxx"
#include "lib/fmt/ExceptionFormatter.hxx"
#include "util/AllocatedString.hxx"

#include <fmt/core.h>

using std::string_view_literals::operator""sv;

static const RootLogger logger;

std::string
GetFingerprint(const PublicKey &key) noexcept
try {
	SSH::Serializer s;
	key.SerializePublic(s);

	const auto digest = SHA256(s.Finish());
	return fmt::format("SHA256:{}"sv, SodiumBase64(digest).c_str());
} catch (...) {
	logger.Fmt(1, "Failed to calculate fingerprint of {} key: {}"sv,
		   key.GetType(), std::current_exception());
	return "ERROR";
}
