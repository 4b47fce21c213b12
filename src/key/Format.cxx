// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "Format.hxx"
#include "Key.hxx"
#include "ssh/Serializer.hxx"
#include "lib/sodium/Base64.hxx"
#include "util/AllocatedString.hxx"

#include <fmt/core.h>

using std::string_view_literals::operator""sv;

AllocatedArray<std::byte>
GetPublicKeyBlob(const PublicKey &key)
{
	SSH::Serializer s;
	key.SerializePublic(s);
	return AllocatedArray<std::byte>{s.Finish()};
}

std::string
ToString(const PublicKey &key)
{
	SSH::Serializer s;
	key.SerializePublic(s);
	return fmt::format("{} {}"sv, key.GetType(), SodiumBase64(s.Finish()).c_str());
}
