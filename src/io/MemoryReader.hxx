// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include "Reader.hxx"

#include <algorithm>
#include <cstddef>
#include <cstdint> // for SIZE_MAX
#include <span>

/**
 * A #Reader implementation which reads from a buffer in memory.
 * The buffer is not copied; it must remain valid.
 */
class MemoryReader final : public Reader {
	std::span<const std::byte> buffer;

	/**
	 * The maximum number of bytes returned by one Read() call.
	 * This allows simulating short reads.
	 */
	std::size_t max_read;

public:
	explicit MemoryReader(std::span<const std::byte> _buffer,
			      std::size_t _max_read=SIZE_MAX) noexcept
		:buffer(_buffer), max_read(_max_read) {}

	/* virtual methods from class Reader */
	std::size_t Read(std::span<std::byte> dest) override {
		std::size_t n = std::min({dest.size(), buffer.size(), max_read});
		std::copy_n(buffer.begin(), n, dest.begin());
		buffer = buffer.subspan(n);
		return n;
	}
};
