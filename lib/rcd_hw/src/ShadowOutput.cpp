#include <rcd/core/Log.hpp>
#include <rcd/hw/ShadowOutput.hpp>

#include <string>

namespace rcd::hw {

Result ShadowPwmOutput::setFrequency(uint16_t hz) {
	frequency_ = hz;
	released_ = false;
	RCD_LOGD("shadow", "pwm frequency=" + std::to_string(hz));
	return Result::Ok();
}

Result ShadowPwmOutput::setPulse(uint8_t channel, uint16_t pulse) {
	if (channel >= kChannels)
		return Result::Fail(Errc::IoFailure, "no such channel");
	pulses_[channel] = pulse;
	++writes_;
	RCD_LOGD("shadow", "pwm ch" + std::to_string(channel) +
						   " pulse=" + std::to_string(pulse));
	return Result::Ok();
}

void ShadowPwmOutput::release() {
	pulses_.fill(0);
	released_ = true;
	RCD_LOGD("shadow", "pwm released");
}

uint16_t ShadowPwmOutput::pulse(uint8_t channel) const {
	return channel < kChannels ? pulses_[channel] : 0;
}

void ShadowMotorOutput::runMotor(uint8_t motor_id, uint16_t speed,
								 bool forward) {
	if (motor_id >= kMotors) {
		RCD_LOGW("shadow", "motor id out of range: " + std::to_string(motor_id));
		return;
	}
	State &s = motors_[motor_id];
	s.speed = speed;
	s.forward = forward;
	s.running = true;
	RCD_LOGD("shadow", "motor" + std::to_string(motor_id) +
						   " speed=" + std::to_string(speed) +
						   (forward ? " fwd" : " rev"));
}

void ShadowMotorOutput::release(uint8_t motor_id) {
	if (motor_id >= kMotors)
		return;
	motors_[motor_id] = State{};
	RCD_LOGD("shadow", "motor" + std::to_string(motor_id) + " released");
}

ShadowMotorOutput::State ShadowMotorOutput::state(uint8_t motor_id) const {
	return motor_id < kMotors ? motors_[motor_id] : State{};
}

} // namespace rcd::hw
