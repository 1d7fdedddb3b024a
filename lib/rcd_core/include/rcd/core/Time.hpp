#pragma once
#include <cstdint>

namespace rcd::core {

struct Time {
	static uint64_t us();
	static uint32_t ms();

	// Blocks the calling thread. Not interruptible.
	static void sleepMs(uint32_t ms);
};

} // namespace rcd::core
