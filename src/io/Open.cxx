// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Open.hxx"
#include "UniqueFileDescriptor.hxx"
#include "lib/fmt/SystemError.hxx"

#include <fcntl.h>

static constexpr int O_COMMON = O_CLOEXEC|O_NOCTTY;

UniqueFileDescriptor
OpenReadOnly(const char *path, int flags)
{
	int fd = open(path, O_RDONLY|O_COMMON|flags);
	if (fd < 0)
		throw FmtErrno("Failed to open '{}'", path);

	return UniqueFileDescriptor{fd};
}

UniqueFileDescriptor
OpenWriteOnly(const char *path, int flags)
{
	int fd = open(path, O_WRONLY|O_COMMON|flags, 0666);
	if (fd < 0)
		throw FmtErrno("Failed to open '{}'", path);

	return UniqueFileDescriptor{fd};
}
