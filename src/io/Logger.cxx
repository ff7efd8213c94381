// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Logger.hxx"
#include "Iovec.hxx"
#include "util/Exception.hxx"

#include <fmt/format.h>

#include <array>
#include <exception>
#include <iterator>
#include <string>

#include <sys/uio.h>
#include <unistd.h>

unsigned LoggerDetail::max_level = 1;

void
LoggerDetail::WriteV(std::string_view domain,
		     std::span<const std::string_view> buffers) noexcept
{
	std::array<struct iovec, 64> v;
	std::size_t n = 0;

	if (!domain.empty()) {
		v[n++] = MakeIovec(std::string_view{"["});
		v[n++] = MakeIovec(domain);
		v[n++] = MakeIovec(std::string_view{"] "});
	}

	for (const auto i : buffers) {
		if (n >= v.size() - 1)
			break;

		v[n++] = MakeIovec(i);
	}

	v[n++] = MakeIovec(std::string_view{"\n"});

	ssize_t nbytes = writev(STDERR_FILENO, v.data(), n);
	(void)nbytes;
}

void
LoggerDetail::Fmt(unsigned level, std::string_view domain,
		  fmt::string_view format_str, fmt::format_args args) noexcept
{
	if (!CheckLevel(level))
		return;

	fmt::memory_buffer buffer;
	try {
		fmt::vformat_to(std::back_inserter(buffer), format_str, args);
	} catch (const std::exception &e) {
		/* a bad format string or out of memory; log what we
		   have */
		buffer.clear();
		buffer.append(std::string_view{"Log formatting failed: "});
		buffer.append(std::string_view{e.what()});
	}

	const std::string_view s[]{{buffer.data(), buffer.size()}};
	WriteV(domain, s);
}

void
LoggerDetail::WriteException(unsigned level, std::string_view domain,
			     std::exception_ptr ep) noexcept
{
	if (!CheckLevel(level))
		return;

	const std::string msg = GetFullMessage(std::move(ep));
	const std::string_view s[]{msg};
	WriteV(domain, s);
}
