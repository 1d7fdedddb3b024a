#pragma once

#include "config/Config.h"

#include <cmath>
#include <cstdint>

namespace control {

// Linear map of `value` from [in_min, in_max] to [out_min, out_max].
// No clamping: values outside the input interval are extrapolated.
// in_min == in_max is a precondition violation (config validation rules it out).
constexpr double mapRange(double value, double in_min, double in_max,
						  double out_min, double out_max) {
	return out_min + (value - in_min) * (out_max - out_min) / (in_max - in_min);
}

// [-1, 1] check shared by every actuator. NaN is rejected too.
inline bool isNormalized(float v) {
	return v >= cfg::CMD_MIN && v <= cfg::CMD_MAX;
}

inline uint16_t toPulse(double v) {
	if (v <= 0.0)
		return 0;
	if (v >= (double)cfg::PWM_PULSE_MAX)
		return cfg::PWM_PULSE_MAX;
	return (uint16_t)std::lround(v);
}

// Motor magnitudes truncate toward zero. A float command like 0.7f is
// 0.69999998..., so the product is nudged by a small epsilon before the cut
// (0.7 * 100 -> 70, 0.5 * 255 -> 127).
inline uint16_t toMagnitude(double v) {
	constexpr double kEpsilon = 1e-4;
	if (v <= 0.0)
		return 0;
	v += kEpsilon;
	if (v >= 65535.0)
		return 0xFFFF;
	return (uint16_t)v;
}

} // namespace control
