// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <string_view>

#include <sys/uio.h>

constexpr struct iovec
MakeIovec(std::string_view s) noexcept
{
	return { const_cast<char *>(s.data()), s.size() };
}
