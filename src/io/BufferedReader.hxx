// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include <cstddef>
#include <span>
#include <vector>

class Reader;

/**
 * Splits the data from a #Reader into lines.  The internal buffer
 * grows as needed, so lines of arbitrary length are supported.
 */
class BufferedReader {
	Reader &reader;

	std::vector<std::byte> buffer;

	/**
	 * The range of #buffer which contains data which has not yet
	 * been consumed.
	 */
	std::size_t head = 0, tail = 0;

	/**
	 * The number of bytes after #head which are known to contain
	 * no newline character.
	 */
	std::size_t scanned = 0;

	bool eof = false;

	std::size_t line_number = 0;

public:
	static constexpr std::size_t DEFAULT_SIZE = 16384;

	explicit BufferedReader(Reader &_reader,
				std::size_t initial_size=DEFAULT_SIZE);

	BufferedReader(const BufferedReader &) = delete;
	BufferedReader &operator=(const BufferedReader &) = delete;

	/**
	 * Read the next line, including its newline character (if
	 * there is one; the last line of a stream may lack it).
	 *
	 * The returned span points into the internal buffer and is
	 * valid until the next call.
	 *
	 * Throws on I/O error.
	 *
	 * @return the line or an empty span on end-of-stream
	 */
	std::span<const std::byte> ReadLine();

	/**
	 * The number of lines returned by ReadLine() so far.
	 */
	std::size_t GetLineNumber() const noexcept {
		return line_number;
	}

private:
	/**
	 * Read more data from the #Reader, moving or growing the
	 * buffer first if there is no room left.
	 *
	 * @return false on end-of-stream
	 */
	bool Fill();
};
