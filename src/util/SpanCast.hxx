// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include <cstddef>
#include <span>
#include <string_view>

/**
 * Cast a character span to a std::byte span.
 */
inline std::span<const std::byte>
AsBytes(std::string_view s) noexcept
{
	return std::as_bytes(std::span{s.data(), s.size()});
}

/**
 * Cast a std::byte span to a std::string_view.
 */
inline std::string_view
ToStringView(std::span<const std::byte> s) noexcept
{
	return {reinterpret_cast<const char *>(s.data()), s.size()};
}
