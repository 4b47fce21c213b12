// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "ECDSACurve.hxx"
#include "Error.hxx"

#include <openssl/objects.h>

ECDSACurve
ParseECDSACurve(std::string_view s)
{
	for (const auto curve : all_ecdsa_curves)
		if (s == GetIdentifier(curve))
			return curve;

	throw UnsupportedCurveError{"Unsupported ECDSA curve"};
}

ECDSACurve
ParseECDSAAlgorithmName(std::string_view s)
{
	for (const auto curve : all_ecdsa_curves)
		if (s == GetAlgorithmName(curve))
			return curve;

	throw UnsupportedCurveError{"Unsupported ECDSA algorithm"};
}

ECDSACurve
GetECDSACurveByNid(int nid)
{
	if (nid == NID_undef)
		throw InvalidFormatError{"EC group has no curve name"};

	for (const auto curve : all_ecdsa_curves)
		if (nid == GetNid(curve))
			return curve;

	throw InvalidFormatError{"Unsupported EC group"};
}

ECDSACurve
GetECDSACurveByName(const char *name)
{
	int nid = OBJ_sn2nid(name);
	if (nid == NID_undef)
		nid = EC_curve_nist2nid(name);

	return GetECDSACurveByNid(nid);
}

ECDSACurve
GetECDSACurve(const EC_GROUP &group)
{
	return GetECDSACurveByNid(EC_GROUP_get_curve_name(&group));
}
