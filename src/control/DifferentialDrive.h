#pragma once

#include "config/Params.h"

#include <rcd/core/Result.hpp>
#include <rcd/hw/MotorOutput.hpp>

#include <cstdint>

namespace control {

struct DifferentialSpeeds {
	float left = 0.0f;
	float right = 0.0f;
};

struct MotorCommand {
	uint16_t speed = 0;
	bool forward = false;
};

// Skid-steer / differential chassis driven from one (steering, throttle) pair.
//
// Quadrant blending slows the inner side by the steering amount:
//   steering > 0, throttle > 0 : right = throttle - steering
//   steering < 0, throttle > 0 : left  = throttle + steering
//   steering > 0, throttle < 0 : right = throttle + steering
//   steering < 0, throttle < 0 : left  = throttle - steering
// The other side keeps the throttle. Each side is then sent to every motor
// wired to it, honoring the per-motor polarity flag.
class DifferentialDrive {
public:
	DifferentialDrive(rcd::hw::IMotorOutput &out,
					  const cfg::DifferentialParams &params);

	static DifferentialSpeeds blend(float steering, float throttle);

	rcd::Result run(float steering, float throttle);

	// Releases every wired motor.
	void shutdown();

	MotorCommand commandFor(float speed) const;
	const DifferentialSpeeds &lastSpeeds() const { return last_; }

private:
	void runSide_(cfg::Side side, float speed);

	rcd::hw::IMotorOutput &out_;
	cfg::DifferentialParams params_;
	DifferentialSpeeds last_{};
};

} // namespace control
