#pragma once

#include "config/Params.h"

#include <rcd/core/Result.hpp>
#include <rcd/hw/PwmChannel.hpp>

#include <cstdint>

namespace control {

// Steering servo: angle [-1 (left) .. 1 (right)] -> pulse.
class SteeringActuator {
public:
	static constexpr float LEFT_ANGLE = -1.0f;
	static constexpr float RIGHT_ANGLE = 1.0f;

	SteeringActuator(rcd::hw::PwmChannel &channel,
					 const cfg::SteeringParams &params);

	rcd::Result run(float angle);
	void shutdown();

	uint16_t pulseFor(float angle) const;
	float lastAngle() const { return last_angle_; }

private:
	rcd::hw::PwmChannel &channel_;
	cfg::SteeringParams params_;
	float last_angle_ = 0.0f;
};

} // namespace control
