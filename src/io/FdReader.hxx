// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include "Reader.hxx"
#include "FileDescriptor.hxx"

/**
 * A #Reader implementation which reads from a (blocking) file
 * descriptor, e.g. a regular file, a pipe or stdin.  It does not own
 * the file descriptor.
 */
class FdReader final : public Reader {
	FileDescriptor fd;

public:
	explicit FdReader(FileDescriptor _fd) noexcept
		:fd(_fd) {}

	/* virtual methods from class Reader */
	std::size_t Read(std::span<std::byte> dest) override;
};
