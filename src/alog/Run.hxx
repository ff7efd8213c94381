// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "Stats.hxx"

class Reader;
class OutputStream;

namespace Alog {

struct Config;
struct IOConfig;

/**
 * Open the inputs and the output described by #io_config, and
 * rewrite all inputs (in order) into the output.
 *
 * Throws on error; output which was already written is not rolled
 * back.
 */
Stats
Run(const Config &config, const IOConfig &io_config);

/**
 * Like Run(), but with caller-supplied streams.  The output is
 * flushed at the end, and also before an error is rethrown.
 *
 * Throws on error.
 */
Stats
RunRaw(const Config &config, Reader &reader, OutputStream &output);

} // namespace Alog
