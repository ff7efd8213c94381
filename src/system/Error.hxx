// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include <system_error> // IWYU pragma: export

#include <errno.h>

/**
 * Returns the error_category to be used to wrap errno values.  The
 * C++ standard does not define this well, so this code is based on
 * observations what C++ standard library implementations actually
 * use.
 */
[[gnu::const]]
static inline const std::error_category &
ErrnoCategory() noexcept
{
	return std::generic_category();
}

[[nodiscard]] [[gnu::pure]]
static inline std::system_error
MakeErrno(int code, const char *msg) noexcept
{
	return std::system_error(code, ErrnoCategory(), msg);
}

[[nodiscard]] [[gnu::pure]]
static inline std::system_error
MakeErrno(const char *msg) noexcept
{
	return MakeErrno(errno, msg);
}

[[gnu::pure]]
inline bool
IsErrno(const std::system_error &e, int code) noexcept
{
	return e.code().category() == ErrnoCategory() &&
		e.code().value() == code;
}

[[gnu::pure]]
static inline bool
IsFileNotFound(const std::system_error &e) noexcept
{
	return IsErrno(e, ENOENT);
}
