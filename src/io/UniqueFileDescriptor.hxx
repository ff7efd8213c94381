// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include "FileDescriptor.hxx" // IWYU pragma: export

#include <utility>

/**
 * An OO wrapper for an owned UNIX file descriptor.  The destructor
 * closes it.
 */
class UniqueFileDescriptor : public FileDescriptor {
public:
	[[nodiscard]]
	UniqueFileDescriptor() noexcept
		:FileDescriptor(FileDescriptor::Undefined()) {}

	[[nodiscard]]
	explicit UniqueFileDescriptor(int _fd) noexcept
		:FileDescriptor(_fd) {}

	[[nodiscard]]
	explicit UniqueFileDescriptor(FileDescriptor _fd) noexcept
		:FileDescriptor(_fd) {}

	UniqueFileDescriptor(const UniqueFileDescriptor &) = delete;

	[[nodiscard]]
	UniqueFileDescriptor(UniqueFileDescriptor &&other) noexcept
		:FileDescriptor(other.Steal()) {}

	~UniqueFileDescriptor() noexcept {
		if (IsDefined())
			Close();
	}

	UniqueFileDescriptor &operator=(UniqueFileDescriptor &&src) noexcept {
		using std::swap;
		swap(fd, src.fd);
		return *this;
	}

	/**
	 * Release ownership and return a "plain" #FileDescriptor.
	 */
	[[nodiscard]]
	FileDescriptor Release() noexcept {
		return FileDescriptor{Steal()};
	}
};
