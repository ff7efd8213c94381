// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "BufferedOutputStream.hxx"
#include "OutputStream.hxx"

#include <algorithm>

BufferedOutputStream::BufferedOutputStream(OutputStream &_os,
					   std::size_t size)
	:os(_os), buffer(std::max<std::size_t>(size, 1)) {}

void
BufferedOutputStream::Write(std::span<const std::byte> src)
{
	if (src.size() > buffer.size() - fill) {
		Flush();

		if (src.size() >= buffer.size()) {
			/* too large for the buffer: bypass it */
			os.Write(src);
			return;
		}
	}

	std::copy(src.begin(), src.end(), buffer.begin() + fill);
	fill += src.size();
}

void
BufferedOutputStream::Flush()
{
	if (fill == 0)
		return;

	const std::span<const std::byte> src{buffer.data(), fill};

	/* clear before writing; after an error, the stream is
	   unusable anyway */
	fill = 0;
	os.Write(src);
}
