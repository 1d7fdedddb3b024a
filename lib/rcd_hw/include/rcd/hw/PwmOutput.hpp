#pragma once
#include <rcd/core/Result.hpp>

#include <cstdint>

namespace rcd::hw {

// PWM board capability (e.g. a 16-channel 12-bit servo driver).
// Implementations own the bus handle; the control code only borrows them.
class IPwmOutput {
public:
	virtual ~IPwmOutput() = default;

	// Construction-time setup. Errc::NotReady when the board is unreachable.
	virtual Result setFrequency(uint16_t hz) = 0;

	// Errc::IoFailure on a bus write error.
	virtual Result setPulse(uint8_t channel, uint16_t pulse) = 0;

	// Explicit teardown, called by the owner of the control loop.
	virtual void release() = 0;
};

} // namespace rcd::hw
