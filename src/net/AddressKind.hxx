// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <cstdint>
#include <string_view>

enum class AddressKind : uint8_t {
	/**
	 * Not a numeric address; probably a host name.
	 */
	NONE,

	/**
	 * A dotted-decimal IPv4 address.
	 */
	IPV4,

	/**
	 * A textual IPv6 address (without zone id).
	 */
	IPV6,
};

/**
 * Check whether the given token is a numeric IPv4 or IPv6 address.
 * The token is decoded as UTF-8 first, substituting ill-formed byte
 * sequences; a token which is not valid UTF-8 is therefore never an
 * address.
 *
 * IPv4 addresses must consist of exactly four decimal octets without
 * leading zeroes.  IPv6 addresses may use "::" compression and an
 * embedded IPv4 address; scope ids ("%eth0") are not accepted.
 */
AddressKind
ClassifyAddress(std::string_view token);
