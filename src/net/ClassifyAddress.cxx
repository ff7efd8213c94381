// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "AddressKind.hxx"
#include "util/UTF8.hxx"

#include <algorithm>

#include <arpa/inet.h>
#include <netinet/in.h>

/**
 * Longer than any textual IPv4/IPv6 address (INET6_ADDRSTRLEN
 * includes the null terminator).
 */
static constexpr std::size_t MAX_ADDRESS_LENGTH = INET6_ADDRSTRLEN;

static bool
IsAddress(int family, const char *s) noexcept
{
	union {
		struct in_addr v4;
		struct in6_addr v6;
	} buffer;

	return inet_pton(family, s, &buffer) == 1;
}

AddressKind
ClassifyAddress(std::string_view token)
{
	const std::string text = ToLossyUTF8(token);

	/* inet_pton() stops at the first null byte, which would
	   accept garbage after it */
	if (text.empty() || text.size() >= MAX_ADDRESS_LENGTH ||
	    std::find(text.begin(), text.end(), '\0') != text.end())
		return AddressKind::NONE;

	if (IsAddress(AF_INET, text.c_str()))
		return AddressKind::IPV4;

	if (IsAddress(AF_INET6, text.c_str()))
		return AddressKind::IPV6;

	return AddressKind::NONE;
}
