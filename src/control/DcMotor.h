#pragma once

#include "config/Config.h"

#include <rcd/core/Result.hpp>
#include <rcd/hw/MotorOutput.hpp>

#include <cstdint>

namespace control {

// One motor of a DC motor board (one per wheel on a differential car).
class DcMotor {
public:
	DcMotor(rcd::hw::IMotorOutput &out, uint8_t motor_id,
			uint16_t speed_scale = cfg::DEFAULT_DC_MOTOR_SPEED_SCALE);

	// speed: [-1..1], positive forward
	rcd::Result run(float speed);
	void shutdown();

	float lastSpeed() const { return last_speed_; }
	uint16_t lastMagnitude() const { return last_magnitude_; }

private:
	rcd::hw::IMotorOutput &out_;
	uint8_t motor_id_;
	uint16_t speed_scale_;
	float last_speed_ = 0.0f;
	uint16_t last_magnitude_ = 0;
};

} // namespace control
