// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <cstdint>

namespace Alog {

struct Stats {
	/**
	 * The number of lines which were read.
	 */
	uint64_t lines = 0;

	/**
	 * The number of lines whose first word was replaced.
	 */
	uint64_t rewritten = 0;

	/**
	 * The number of lines without a first word which were copied
	 * unchanged.
	 */
	uint64_t passed = 0;

	/**
	 * The number of lines without a first word which were
	 * omitted.
	 */
	uint64_t skipped = 0;

	/**
	 * The number of "$remote_user" fields which were cleared.
	 */
	uint64_t authuser_cleared = 0;

	/**
	 * The number of additional occurrences which were replaced
	 * in "thorough" mode.
	 */
	uint64_t thorough_replaced = 0;

	constexpr Stats &operator+=(const Stats &other) noexcept {
		lines += other.lines;
		rewritten += other.rewritten;
		passed += other.passed;
		skipped += other.skipped;
		authuser_cleared += other.authuser_cleared;
		thorough_replaced += other.thorough_replaced;
		return *this;
	}
};

} // namespace Alog
