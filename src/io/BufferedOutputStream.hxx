// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include <cstddef>
#include <span>
#include <string_view>
#include <vector>

class OutputStream;

/**
 * An adapter for an #OutputStream which collects small writes in a
 * buffer.  Data is submitted to the #OutputStream only when the
 * buffer is full or when Flush() is called; the destructor does not
 * flush.
 */
class BufferedOutputStream {
	OutputStream &os;

	std::vector<std::byte> buffer;

	std::size_t fill = 0;

public:
	static constexpr std::size_t DEFAULT_SIZE = 32768;

	explicit BufferedOutputStream(OutputStream &_os,
				      std::size_t size=DEFAULT_SIZE);

	BufferedOutputStream(const BufferedOutputStream &) = delete;
	BufferedOutputStream &operator=(const BufferedOutputStream &) = delete;

	/**
	 * Throws on error.
	 */
	void Write(std::span<const std::byte> src);

	void Write(std::string_view src) {
		Write(std::as_bytes(std::span{src.data(), src.size()}));
	}

	/**
	 * Submit all buffered data to the #OutputStream.
	 *
	 * Throws on error.
	 */
	void Flush();
};
