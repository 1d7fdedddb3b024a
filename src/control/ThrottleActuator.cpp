#include "control/ThrottleActuator.h"
#include "control/RangeMap.h"

#include <rcd/core/Log.hpp>
#include <rcd/core/Time.hpp>

#include <string>

namespace control {

ThrottleActuator::ThrottleActuator(rcd::hw::PwmChannel &channel,
								   const cfg::ThrottleParams &params)
	: channel_(channel), params_(params) {
	// ESC キャリブレーション: ニュートラルを送って待つ
	channel_.setPulse(params_.zero_pulse);
	RCD_LOGI("throttle", "arming ESC: zero_pulse=" +
							 std::to_string(params_.zero_pulse) + " wait " +
							 std::to_string(params_.arm_delay_ms) + "ms");
	rcd::core::Time::sleepMs(params_.arm_delay_ms);
}

uint16_t ThrottleActuator::pulseFor(float throttle) const {
	double pulse;
	if (throttle > 0.0f) {
		pulse = mapRange(throttle, 0.0, MAX_THROTTLE, params_.zero_pulse,
						 params_.max_pulse);
	} else {
		pulse = mapRange(throttle, MIN_THROTTLE, 0.0, params_.min_pulse,
						 params_.zero_pulse);
	}
	return toPulse(pulse);
}

rcd::Result ThrottleActuator::run(float throttle) {
	if (!isNormalized(throttle)) {
		RCD_LOGW("throttle",
				 "throttle out of range: " + std::to_string(throttle));
		return rcd::Result::Fail(rcd::Errc::InvalidCommand,
								 "throttle must be between -1 and 1");
	}
	last_throttle_ = throttle;
	channel_.setPulse(pulseFor(throttle));
	return rcd::Result::Ok();
}

void ThrottleActuator::shutdown() {
	// 停止（run(0) と同じパルス）
	last_throttle_ = 0.0f;
	channel_.setPulse(pulseFor(0.0f));
}

} // namespace control
