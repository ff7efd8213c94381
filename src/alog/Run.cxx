// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Run.hxx"
#include "Config.hxx"
#include "LineRewriter.hxx"
#include "io/BufferedOutputStream.hxx"
#include "io/BufferedReader.hxx"
#include "io/FdOutputStream.hxx"
#include "io/FdReader.hxx"
#include "io/Logger.hxx"
#include "io/Open.hxx"
#include "io/UniqueFileDescriptor.hxx"
#include "lib/fmt/RuntimeError.hxx"

#include <exception>

#include <fcntl.h>
#include <unistd.h>

namespace Alog {

static const LLogger logger{"alog"};

static void
LogStats(std::string_view name, const Stats &stats) noexcept
{
	logger.Fmt(3, "{}: {} lines, {} rewritten, {} passed, {} skipped, "
		   "{} authuser cleared, {} more replaced",
		   name, stats.lines, stats.rewritten, stats.passed,
		   stats.skipped, stats.authuser_cleared,
		   stats.thorough_replaced);
}

/**
 * Submit the lines which were rewritten before an error occurred.
 * An error while doing so is only logged, because the caller is
 * about to throw the original error.
 */
static void
FlushAfterError(BufferedOutputStream &os) noexcept
{
	try {
		os.Flush();
	} catch (...) {
		logger.Write(1, std::current_exception());
	}
}

static bool
IsStdin(std::string_view path) noexcept
{
	return path == "-";
}

/**
 * Rewrite one input, wrapping any error with the input name.
 */
static Stats
RewriteInput(const Config &config, std::string_view name, Reader &reader,
	     BufferedOutputStream &os)
{
	LineRewriter rewriter{config};
	BufferedReader buffered_reader{reader};

	try {
		rewriter.RewriteAll(buffered_reader, os);
	} catch (...) {
		FlushAfterError(os);
		std::throw_with_nested(FmtRuntimeError("Failed to process '{}'",
						       name));
	}

	/* submit this input's output before the next input is
	   opened */
	os.Flush();

	LogStats(name, rewriter.GetStats());
	return rewriter.GetStats();
}

Stats
RunRaw(const Config &config, Reader &reader, OutputStream &output)
{
	BufferedOutputStream os{output};
	BufferedReader buffered_reader{reader};
	LineRewriter rewriter{config};

	try {
		rewriter.RewriteAll(buffered_reader, os);
	} catch (...) {
		FlushAfterError(os);
		throw;
	}

	os.Flush();
	return rewriter.GetStats();
}

Stats
Run(const Config &config, const IOConfig &io_config)
{
	UniqueFileDescriptor output_fd;
	if (!io_config.output.empty()) {
		output_fd = OpenWriteOnly(io_config.output.c_str(),
					  O_CREAT|O_APPEND);
		logger.Fmt(2, "Appending to '{}'", io_config.output);
	}

	FdOutputStream output{output_fd.IsDefined()
			      ? FileDescriptor{output_fd}
			      : FileDescriptor{STDOUT_FILENO}};
	BufferedOutputStream os{output};

	Stats total;

	if (io_config.inputs.empty()) {
		logger.Write(2, "Reading standard input");
		FdReader reader{FileDescriptor{STDIN_FILENO}};
		total += RewriteInput(config, "stdin", reader, os);
	} else {
		for (const auto &path : io_config.inputs) {
			if (IsStdin(path)) {
				logger.Write(2, "Reading standard input");
				FdReader reader{FileDescriptor{STDIN_FILENO}};
				total += RewriteInput(config, "stdin", reader, os);
				continue;
			}

			/* inputs are opened one after another, so an
			   error aborts the run after the previous
			   inputs have been written */
			const auto fd = OpenReadOnly(path.c_str());
			logger.Fmt(2, "Reading '{}'", path);

			FdReader reader{fd};
			total += RewriteInput(config, path, reader, os);
		}
	}

	if (io_config.inputs.size() > 1)
		LogStats("total", total);

	return total;
}

} // namespace Alog
