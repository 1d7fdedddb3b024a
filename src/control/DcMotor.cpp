#include "control/DcMotor.h"
#include "control/RangeMap.h"

#include <rcd/core/Log.hpp>

#include <cmath>
#include <string>

namespace control {

DcMotor::DcMotor(rcd::hw::IMotorOutput &out, uint8_t motor_id,
				 uint16_t speed_scale)
	: out_(out), motor_id_(motor_id), speed_scale_(speed_scale) {}

rcd::Result DcMotor::run(float speed) {
	if (!isNormalized(speed)) {
		RCD_LOGW("motor", "motor" + std::to_string(motor_id_) +
							  " speed out of range: " + std::to_string(speed));
		return rcd::Result::Fail(rcd::Errc::InvalidCommand,
								 "speed must be between 1(forward) and "
								 "-1(reverse)");
	}
	last_speed_ = speed;
	last_magnitude_ =
		toMagnitude(mapRange(std::fabs(speed), 0.0, 1.0, 0.0, speed_scale_));
	out_.runMotor(motor_id_, last_magnitude_, speed > 0.0f);
	return rcd::Result::Ok();
}

void DcMotor::shutdown() {
	out_.release(motor_id_);
	last_speed_ = 0.0f;
	last_magnitude_ = 0;
}

} // namespace control
