// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "net/AddressKind.hxx"

#include <gtest/gtest.h>

#include <string>

using std::string_view_literals::operator""sv;

TEST(ClassifyAddress, IPv4)
{
	EXPECT_EQ(ClassifyAddress("8.8.8.8"sv), AddressKind::IPV4);
	EXPECT_EQ(ClassifyAddress("127.0.0.1"sv), AddressKind::IPV4);
	EXPECT_EQ(ClassifyAddress("0.0.0.0"sv), AddressKind::IPV4);
	EXPECT_EQ(ClassifyAddress("255.255.255.255"sv), AddressKind::IPV4);
}

TEST(ClassifyAddress, InvalidIPv4)
{
	EXPECT_EQ(ClassifyAddress("256.1.1.1"sv), AddressKind::NONE);
	EXPECT_EQ(ClassifyAddress("1.2.3"sv), AddressKind::NONE);
	EXPECT_EQ(ClassifyAddress("1.2.3.4.5"sv), AddressKind::NONE);
	EXPECT_EQ(ClassifyAddress("1.2.3.4:80"sv), AddressKind::NONE);
	EXPECT_EQ(ClassifyAddress(" 1.2.3.4"sv), AddressKind::NONE);
	EXPECT_EQ(ClassifyAddress("01.2.3.4"sv), AddressKind::NONE);
	EXPECT_EQ(ClassifyAddress("1.2.3.4\0"sv), AddressKind::NONE);
}

TEST(ClassifyAddress, IPv6)
{
	EXPECT_EQ(ClassifyAddress("::1"sv), AddressKind::IPV6);
	EXPECT_EQ(ClassifyAddress("::"sv), AddressKind::IPV6);
	EXPECT_EQ(ClassifyAddress("2a00:1450:4001:81b::2004"sv), AddressKind::IPV6);
	EXPECT_EQ(ClassifyAddress("1:2:3:4:5:6:7:8"sv), AddressKind::IPV6);
	EXPECT_EQ(ClassifyAddress("fe80::1"sv), AddressKind::IPV6);
	EXPECT_EQ(ClassifyAddress("::ffff:1.2.3.4"sv), AddressKind::IPV6);
	EXPECT_EQ(ClassifyAddress("FE80::ABCD"sv), AddressKind::IPV6);
}

TEST(ClassifyAddress, InvalidIPv6)
{
	EXPECT_EQ(ClassifyAddress(":::"sv), AddressKind::NONE);
	EXPECT_EQ(ClassifyAddress("1:2:3:4:5:6:7:8:9"sv), AddressKind::NONE);
	EXPECT_EQ(ClassifyAddress("1::2::3"sv), AddressKind::NONE);
	EXPECT_EQ(ClassifyAddress("[::1]"sv), AddressKind::NONE);
	EXPECT_EQ(ClassifyAddress("fe80::1%eth0"sv), AddressKind::NONE);
	EXPECT_EQ(ClassifyAddress("12345::"sv), AddressKind::NONE);
}

TEST(ClassifyAddress, Host)
{
	EXPECT_EQ(ClassifyAddress(""sv), AddressKind::NONE);
	EXPECT_EQ(ClassifyAddress("localhost"sv), AddressKind::NONE);
	EXPECT_EQ(ClassifyAddress("google.com"sv), AddressKind::NONE);
	EXPECT_EQ(ClassifyAddress("-"sv), AddressKind::NONE);
}

TEST(ClassifyAddress, Garbage)
{
	EXPECT_EQ(ClassifyAddress("\x00\x9f\x92\x96"sv), AddressKind::NONE);
	EXPECT_EQ(ClassifyAddress("\xf0\x9f\x92\x96"sv), AddressKind::NONE);
	EXPECT_EQ(ClassifyAddress("1.2.3.\xff"sv), AddressKind::NONE);

	/* too long for any address */
	EXPECT_EQ(ClassifyAddress(std::string(1000, '1')), AddressKind::NONE);
}

TEST(ClassifyAddress, Idempotent)
{
	/* the default replacements are classified like the
	   addresses they replace */
	EXPECT_EQ(ClassifyAddress("127.0.0.1"sv), AddressKind::IPV4);
	EXPECT_EQ(ClassifyAddress("::1"sv), AddressKind::IPV6);
	EXPECT_EQ(ClassifyAddress("localhost"sv), AddressKind::NONE);
}
