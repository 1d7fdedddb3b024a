#pragma once
#include <rcd/core/Result.hpp>
#include <rcd/hw/PwmOutput.hpp>

#include <cstdint>

namespace rcd::hw {

// One channel of a PWM board.
//
// Bus write failures are logged and the pulse is dropped for that tick so a
// flaky wire does not take the control loop down. The actuator keeps its last
// physical position in that case.
class PwmChannel {
public:
	PwmChannel(IPwmOutput &out, uint8_t channel);

	// Configures the board frequency. Failure is fatal for the caller.
	Result begin(uint16_t frequency_hz);

	void setPulse(uint16_t pulse);

	uint8_t channel() const { return channel_; }
	uint16_t lastPulse() const { return last_pulse_; }
	bool hasPulse() const { return has_pulse_; }
	uint32_t dropped() const { return dropped_; }

private:
	IPwmOutput &out_;
	uint8_t channel_;
	uint16_t last_pulse_ = 0;
	bool has_pulse_ = false;
	uint32_t dropped_ = 0;
};

} // namespace rcd::hw
