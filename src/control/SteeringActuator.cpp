#include "control/SteeringActuator.h"
#include "control/RangeMap.h"

#include <rcd/core/Log.hpp>

#include <string>

namespace control {

SteeringActuator::SteeringActuator(rcd::hw::PwmChannel &channel,
								   const cfg::SteeringParams &params)
	: channel_(channel), params_(params) {}

uint16_t SteeringActuator::pulseFor(float angle) const {
	// left_pulse > right_pulse の配線もそのまま写像できる
	return toPulse(mapRange(angle, LEFT_ANGLE, RIGHT_ANGLE, params_.left_pulse,
							params_.right_pulse));
}

rcd::Result SteeringActuator::run(float angle) {
	if (!isNormalized(angle)) {
		RCD_LOGW("steer", "angle out of range: " + std::to_string(angle));
		return rcd::Result::Fail(rcd::Errc::InvalidCommand,
								 "steering must be between -1 and 1");
	}
	last_angle_ = angle;
	channel_.setPulse(pulseFor(angle));
	return rcd::Result::Ok();
}

void SteeringActuator::shutdown() {
	// 直進に戻す（run(0) と同じパルス）
	last_angle_ = 0.0f;
	channel_.setPulse(pulseFor(0.0f));
}

} // namespace control
