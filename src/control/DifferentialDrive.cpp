#include "control/DifferentialDrive.h"
#include "control/RangeMap.h"

#include <rcd/core/Log.hpp>

#include <algorithm>
#include <cmath>
#include <sstream>
#include <string>

namespace control {

DifferentialDrive::DifferentialDrive(rcd::hw::IMotorOutput &out,
									 const cfg::DifferentialParams &params)
	: out_(out), params_(params) {}

DifferentialSpeeds DifferentialDrive::blend(float steering, float throttle) {
	DifferentialSpeeds s{};
	if (steering == 0.0f) {
		s.left = throttle;
		s.right = throttle;
	} else if (steering > 0.0f && throttle > 0.0f) {
		s.left = throttle;
		s.right = throttle - steering;
	} else if (steering < 0.0f && throttle > 0.0f) {
		s.left = throttle + steering;
		s.right = throttle;
	} else if (steering > 0.0f && throttle < 0.0f) {
		s.left = throttle;
		s.right = throttle + steering;
	} else if (steering < 0.0f && throttle < 0.0f) {
		s.left = throttle - steering;
		s.right = throttle;
	}
	// throttle == 0 かつ steering != 0 は停止。前回値は保持しない
	// （同じ入力なら常に同じ出力、超信地旋回もしない）

	s.left = std::clamp(s.left, cfg::CMD_MIN, cfg::CMD_MAX);
	s.right = std::clamp(s.right, cfg::CMD_MIN, cfg::CMD_MAX);
	return s;
}

MotorCommand DifferentialDrive::commandFor(float speed) const {
	MotorCommand cmd;
	cmd.speed = toMagnitude(
		mapRange(std::fabs(speed), 0.0, 1.0, 0.0, params_.speed_scale));
	cmd.forward = speed > 0.0f;
	return cmd;
}

void DifferentialDrive::runSide_(cfg::Side side, float speed) {
	const MotorCommand cmd = commandFor(speed);
	for (const cfg::MotorWiring &m : params_.wiring) {
		if (m.side != side)
			continue;
		out_.runMotor(m.motor_id, cmd.speed,
					  m.inverted ? !cmd.forward : cmd.forward);
	}
}

rcd::Result DifferentialDrive::run(float steering, float throttle) {
	if (!isNormalized(throttle)) {
		RCD_LOGW("diff", "throttle out of range: " + std::to_string(throttle));
		return rcd::Result::Fail(rcd::Errc::InvalidCommand,
								 "speed must be between 1(forward) and "
								 "-1(reverse)");
	}
	if (!isNormalized(steering)) {
		RCD_LOGW("diff", "steering out of range: " + std::to_string(steering));
		return rcd::Result::Fail(rcd::Errc::InvalidCommand,
								 "steering must be between 1 and -1");
	}

	last_ = blend(steering, throttle);
	runSide_(cfg::Side::Left, last_.left);
	runSide_(cfg::Side::Right, last_.right);

	if (rcd::core::Logger::instance().enabled(rcd::core::LogLevel::Trace)) {
		std::ostringstream ss;
		ss << "steer=" << steering << " throttle=" << throttle
		   << " -> L=" << last_.left << " R=" << last_.right;
		RCD_LOGT("diff", ss.str());
	}
	return rcd::Result::Ok();
}

void DifferentialDrive::shutdown() {
	for (const cfg::MotorWiring &m : params_.wiring)
		out_.release(m.motor_id);
	last_ = DifferentialSpeeds{};
	RCD_LOGI("diff", "motors released");
}

} // namespace control
