// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include "OutputStream.hxx"
#include "FileDescriptor.hxx"

/**
 * An #OutputStream which writes to a blocking file descriptor.  It
 * does not own the file descriptor.
 */
class FdOutputStream final : public OutputStream {
	FileDescriptor fd;

public:
	explicit FdOutputStream(FileDescriptor _fd) noexcept
		:fd(_fd) {}

	/* virtual methods from class OutputStream */
	void Write(std::span<const std::byte> src) override;
};
