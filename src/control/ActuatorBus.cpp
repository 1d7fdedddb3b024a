#include "control/ActuatorBus.h"
#include "control/RangeMap.h"

#include <rcd/core/Log.hpp>

#include <string>

namespace control {

ActuatorBus::ActuatorBus(SteeringActuator &steering, ThrottleActuator &throttle)
	: layout_(Layout::ServoEsc), steering_(&steering), throttle_(&throttle) {}

ActuatorBus::ActuatorBus(DifferentialDrive &drive)
	: layout_(Layout::Differential), drive_(&drive) {}

rcd::Result ActuatorBus::apply(float steering, float throttle,
							   uint32_t now_ms) {
	if (!isNormalized(steering) || !isNormalized(throttle)) {
		RCD_LOGW("bus", "rejected steer=" + std::to_string(steering) +
							" throttle=" + std::to_string(throttle));
		return rcd::Result::Fail(rcd::Errc::InvalidCommand,
								 "steering/throttle must be between -1 and 1");
	}

	if (mode_ == OutputMode::Hardware) {
		rcd::Result r = rcd::Result::Ok();
		if (layout_ == Layout::Differential) {
			r = drive_->run(steering, throttle);
		} else {
			r = steering_->run(steering);
			if (r.ok())
				r = throttle_->run(throttle);
		}
		if (!r.ok())
			return r;
		hardware_driven_ = true;
	}

	last_steering_ = steering;
	last_throttle_ = throttle;

	if (sink_) {
		ActuatorCommand cmd{};
		cmd.now_ms = now_ms;
		cmd.steering = steering;
		cmd.throttle = throttle;
		sink_->onActuatorCommand(cmd);
	}
	return rcd::Result::Ok();
}

void ActuatorBus::shutdown() {
	// モードに関係なく、一度でも実機を動かしていれば必ずニュートラルに戻す
	if (hardware_driven_) {
		if (layout_ == Layout::Differential) {
			drive_->shutdown();
		} else {
			throttle_->shutdown();
			steering_->shutdown();
		}
		hardware_driven_ = false;
	}
	last_steering_ = 0.0f;
	last_throttle_ = 0.0f;
}

} // namespace control
