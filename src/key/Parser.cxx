// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Parser.hxx"
#include "Error.hxx"
#include "ssh/Deserializer.hxx"
#include "lib/sodium/Base64.hxx"
#include "util/AllocatedArray.hxx"
#include "util/StringSplit.hxx"
#include "util/StringStrip.hxx"

ECDSAPublicKey
ParseECDSAPublicKeyBlob(std::span<const std::byte> src,
			ECDSAKeyOptions options)
try {
	SSH::Deserializer d{src};
	const auto curve = ParseECDSAAlgorithmName(d.ReadString());

	if (d.ReadString() != GetIdentifier(curve))
		throw InvalidFormatError{"ECDSA curve does not match algorithm"};

	const auto q = d.ReadLengthEncoded();
	d.ExpectEnd();

	return ECDSAPublicKey{curve, q, options};
} catch (SSH::MalformedPacket) {
	throw InvalidFormatError{"Malformed ECDSA public key blob"};
}

/**
 * Peek at the algorithm name at the beginning of a key blob.
 */
static std::string_view
GetBlobAlgorithm(std::span<const std::byte> blob)
try {
	SSH::Deserializer d{blob};
	return d.ReadString();
} catch (SSH::MalformedPacket) {
	throw InvalidFormatError{"Malformed ECDSA public key blob"};
}

ECDSAPublicKey
ParseECDSAPublicKeyLine(std::string_view line,
			ECDSAKeyOptions options)
{
	const auto [algorithm, rest] = Split(Strip(line), ' ');
	const auto [blob_base64, _] = Split(StripLeft(rest), ' ');
	if (blob_base64.empty())
		throw InvalidFormatError{"Public key blob missing"};

	const auto blob = DecodeBase64(blob_base64);
	if (blob == nullptr)
		throw InvalidFormatError{"base64 decoding failed"};

	const std::span<const std::byte> blob_span{blob.data(), blob.size()};
	if (GetBlobAlgorithm(blob_span) != algorithm)
		throw InvalidFormatError{"Key type does not match public key blob"};

	return ParseECDSAPublicKeyBlob(blob_span, options);
}
