// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <stdexcept>

/**
 * An ECDSA curve identifier was not recognized.
 */
class UnsupportedCurveError : public std::invalid_argument {
public:
	using std::invalid_argument::invalid_argument;
};

/**
 * Key material was rejected: the curve is not supported, the point
 * is not on the curve, a blob is malformed, etc.
 */
class InvalidFormatError : public std::invalid_argument {
public:
	using std::invalid_argument::invalid_argument;
};

/**
 * A signature could not be created or could not be evaluated at
 * all.  This is not thrown for a signature which is merely invalid.
 */
class CryptoError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

/**
 * A key could not be serialized.
 */
class EncodingError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};
