// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "FdReader.hxx"
#include "system/Error.hxx"

#include <cassert>

std::size_t
FdReader::Read(std::span<std::byte> dest)
{
	assert(fd.IsDefined());

	ssize_t nbytes;
	do {
		nbytes = fd.Read(dest);
	} while (nbytes < 0 && errno == EINTR);

	if (nbytes < 0)
		throw MakeErrno("Failed to read");

	return nbytes;
}
