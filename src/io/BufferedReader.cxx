// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "BufferedReader.hxx"
#include "Reader.hxx"

#include <algorithm>
#include <cassert>

BufferedReader::BufferedReader(Reader &_reader, std::size_t initial_size)
	:reader(_reader), buffer(std::max<std::size_t>(initial_size, 1)) {}

bool
BufferedReader::Fill()
{
	assert(!eof);

	if (tail == buffer.size()) {
		if (head > 0) {
			/* move the pending data to the beginning */
			std::copy(buffer.begin() + head, buffer.begin() + tail,
				  buffer.begin());
			tail -= head;
			head = 0;
		} else
			/* the buffer is full with one partial line;
			   grow it */
			buffer.resize(buffer.size() * 2);
	}

	const std::size_t nbytes =
		reader.Read(std::span{buffer}.subspan(tail));
	if (nbytes == 0) {
		eof = true;
		return false;
	}

	tail += nbytes;
	return true;
}

std::span<const std::byte>
BufferedReader::ReadLine()
{
	while (true) {
		const auto begin = buffer.begin() + head;
		const auto end = buffer.begin() + tail;
		const auto newline = std::find(begin + scanned, end,
					       std::byte{'\n'});
		if (newline != end) {
			const std::size_t length = std::distance(begin, newline) + 1;
			const std::span<const std::byte> line{buffer.data() + head, length};
			head += length;
			scanned = 0;
			++line_number;
			return line;
		}

		scanned = tail - head;

		if (eof || !Fill()) {
			/* return the unterminated rest */
			const std::span<const std::byte> line{buffer.data() + head, tail - head};
			head = tail = scanned = 0;
			if (!line.empty())
				++line_number;
			return line;
		}
	}
}
