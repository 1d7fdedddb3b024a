#pragma once
#include <cstdint>

namespace rcd::hw {

// DC motor board capability: unsigned speed plus direction per motor.
class IMotorOutput {
public:
	virtual ~IMotorOutput() = default;

	// speed is in the board's own scale (percent, 8-bit duty, ...).
	virtual void runMotor(uint8_t motor_id, uint16_t speed, bool forward) = 0;
	virtual void release(uint8_t motor_id) = 0;
};

} // namespace rcd::hw
