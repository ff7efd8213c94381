#include "alog/Config.hxx"
#include "alog/Run.hxx"
#include "io/MemoryReader.hxx"
#include "io/StringOutputStream.hxx"

#include <cstdint>
#include <span>

extern "C" {
int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size);
}

int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size)
{
	const auto input = std::as_bytes(std::span{data, size});

	/* the first byte selects the flags */
	const unsigned flags = size > 0 ? data[0] : 0;

	Alog::Config config;
	config.skip = flags & 0x1;
	config.authuser = flags & 0x2;
	config.trim = flags & 0x4;
	config.optimize = flags & 0x8;
	config.thorough = flags & 0x10;

	MemoryReader reader{input, 1 + (flags >> 5)};
	StringOutputStream output;
	Alog::RunRaw(config, reader, output);

	return 0;
}
