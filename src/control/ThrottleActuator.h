#pragma once

#include "config/Params.h"

#include <rcd/core/Result.hpp>
#include <rcd/hw/PwmChannel.hpp>

#include <cstdint>

namespace control {

// ESC throttle: [-1 (full reverse) .. 1 (full forward)] -> pulse.
//
// The mapping is two linear segments meeting at zero_pulse:
//   throttle > 0  : [0, 1]  -> [zero_pulse, max_pulse]
//   throttle <= 0 : [-1, 0] -> [min_pulse, zero_pulse]
//
// Construction arms the ESC: zero_pulse is sent and the calling thread blocks
// for arm_delay_ms before the constructor returns.
class ThrottleActuator {
public:
	static constexpr float MIN_THROTTLE = -1.0f;
	static constexpr float MAX_THROTTLE = 1.0f;

	ThrottleActuator(rcd::hw::PwmChannel &channel,
					 const cfg::ThrottleParams &params);

	rcd::Result run(float throttle);
	void shutdown();

	uint16_t pulseFor(float throttle) const;
	float lastThrottle() const { return last_throttle_; }

private:
	rcd::hw::PwmChannel &channel_;
	cfg::ThrottleParams params_;
	float last_throttle_ = 0.0f;
};

} // namespace control
