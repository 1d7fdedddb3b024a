#include <rcd/core/Log.hpp>
#include <rcd/hw/PwmChannel.hpp>

#include <string>

namespace rcd::hw {

PwmChannel::PwmChannel(IPwmOutput &out, uint8_t channel)
	: out_(out), channel_(channel) {}

Result PwmChannel::begin(uint16_t frequency_hz) {
	const Result r = out_.setFrequency(frequency_hz);
	if (!r.ok()) {
		RCD_LOGE("pwm", "ch" + std::to_string(channel_) +
							" setFrequency(" + std::to_string(frequency_hz) +
							") failed: " + r.msg);
		return r;
	}
	RCD_LOGI("pwm", "ch" + std::to_string(channel_) + " frequency=" +
						std::to_string(frequency_hz) + "Hz");
	return Result::Ok();
}

void PwmChannel::setPulse(uint16_t pulse) {
	const Result r = out_.setPulse(channel_, pulse);
	if (r.ok()) {
		last_pulse_ = pulse;
		has_pulse_ = true;
		return;
	}
	if (r.code != Errc::IoFailure) {
		RCD_LOGE("pwm", "ch" + std::to_string(channel_) + " pulse=" +
							std::to_string(pulse) + " rejected (" +
							errcName(r.code) + "): " + r.msg);
	} else {
		RCD_LOGW("pwm", "ch" + std::to_string(channel_) + " pulse=" +
							std::to_string(pulse) +
							" dropped, check wires to the PWM board: " + r.msg);
	}
	++dropped_;
}

} // namespace rcd::hw
