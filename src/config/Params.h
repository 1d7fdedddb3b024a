#pragma once

#include "config/Config.h"

#include <rcd/core/Result.hpp>

#include <array>
#include <cstdint>
#include <string>

namespace cfg {

enum class Side : uint8_t { Left = 0, Right = 1 };

// One physical motor of a differential chassis.
// inverted: the motor is mounted/wired so that "forward" spins it backwards.
struct MotorWiring {
	uint8_t motor_id;
	Side side;
	bool inverted;
};

struct PwmParams {
	uint16_t frequency_hz = DEFAULT_PWM_FREQ_HZ;
};

struct SteeringParams {
	uint8_t channel = DEFAULT_STEER_CHANNEL;
	uint16_t left_pulse = DEFAULT_STEER_LEFT_PULSE;
	uint16_t right_pulse = DEFAULT_STEER_RIGHT_PULSE;
};

struct ThrottleParams {
	uint8_t channel = DEFAULT_THROTTLE_CHANNEL;
	uint16_t max_pulse = DEFAULT_THROTTLE_MAX_PULSE;
	uint16_t min_pulse = DEFAULT_THROTTLE_MIN_PULSE;
	uint16_t zero_pulse = DEFAULT_THROTTLE_ZERO_PULSE;
	uint32_t arm_delay_ms = DEFAULT_ESC_ARM_DELAY_MS;
};

struct DifferentialParams {
	uint16_t speed_scale = DEFAULT_DIFF_SPEED_SCALE;
	std::array< MotorWiring, DIFF_MOTOR_COUNT > wiring{{
		{1, Side::Left, false},
		{2, Side::Left, false},
		{3, Side::Right, false},
		{4, Side::Right, true},
	}};
};

struct Params {
	PwmParams pwm;
	SteeringParams steering;
	ThrottleParams throttle;
	DifferentialParams diff;
};

rcd::Result validateSteering(const SteeringParams &p);
rcd::Result validateThrottle(const ThrottleParams &p);
rcd::Result validateDifferential(const DifferentialParams &p);
rcd::Result validateParams(const Params &p);

// Applies one "key = value" setting. Errc::InvalidConfig for an unknown key or
// a malformed value; `out` is left untouched in that case.
rcd::Result applyParam(const std::string &key, const std::string &value,
					   Params &out);

// Reads a key=value file ('#' starts a comment) on top of `out`, then
// validates the result.
rcd::Result loadParamsFile(const std::string &path, Params &out);

const char *sideName(Side s);

} // namespace cfg
