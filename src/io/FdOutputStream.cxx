// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "FdOutputStream.hxx"
#include "system/Error.hxx"

#include <stdexcept>

void
FdOutputStream::Write(std::span<const std::byte> src)
{
	while (!src.empty()) {
		auto nbytes = fd.Write(src);
		if (nbytes < 0) {
			if (errno == EINTR)
				continue;

			throw MakeErrno("Failed to write");
		}

		if (nbytes == 0)
			throw std::runtime_error("Short write");

		src = src.subspan(nbytes);
	}
}
