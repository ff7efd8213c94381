// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <cstddef>
#include <string_view>

namespace Alog {

/**
 * The "$remote_user" field may contain whitespace, so its end cannot
 * be found by looking for the next blank.  Instead, this function
 * looks for the beginning of the next field, "$time_local", which
 * has the form " [DD/" (one or two digits).
 *
 * @param start the position where the search begins
 * @return the position of the space before the bracket or
 * std::string_view::npos if none was found
 */
[[gnu::pure]]
std::size_t
FindTimeLocal(std::string_view line, std::size_t start) noexcept;

/**
 * Does the first word (ending at #token_end) seem to be followed by
 * an already cleared "$remote_user" field, i.e. " - - ["?  Only the
 * bytes "- [" at offset 3 after the delimiter are checked, which is
 * where the "$remote_user" field of a combined log line begins.
 */
[[gnu::pure]]
bool
IsAuthUserCleared(std::string_view line, std::size_t token_end) noexcept;

} // namespace Alog
