#pragma once
#include "control/DifferentialDrive.h"
#include "control/SteeringActuator.h"
#include "control/ThrottleActuator.h"

#include <rcd/core/Result.hpp>

#include <cstdint>

namespace control {

enum class OutputMode : uint8_t {
	Hardware = 0,
	Shadow = 1, // sink only, hardware untouched
};

enum class Layout : uint8_t {
	ServoEsc = 0,
	Differential = 1,
};

struct ActuatorCommand {
	uint32_t now_ms = 0;
	float steering = 0.0f;
	float throttle = 0.0f;
};

class CommandSink {
public:
	virtual ~CommandSink() = default;
	virtual void onActuatorCommand(const ActuatorCommand &cmd) = 0;
};

// Entry point for the control loop: one (steering, throttle) pair per tick.
class ActuatorBus {
public:
	ActuatorBus(SteeringActuator &steering, ThrottleActuator &throttle);
	explicit ActuatorBus(DifferentialDrive &drive);

	void setOutputMode(OutputMode mode) { mode_ = mode; }
	Layout layout() const { return layout_; }

	void attachSink(CommandSink *sink) { sink_ = sink; }

	// Both commands are validated before anything is actuated.
	rcd::Result apply(float steering, float throttle, uint32_t now_ms);

	// Neutral steering/throttle (or released motors) whenever hardware was
	// driven since the last shutdown, even if the bus is now in Shadow mode.
	void shutdown();

	float lastSteering() const { return last_steering_; }
	float lastThrottle() const { return last_throttle_; }

private:
	Layout layout_;
	SteeringActuator *steering_ = nullptr;
	ThrottleActuator *throttle_ = nullptr;
	DifferentialDrive *drive_ = nullptr;
	OutputMode mode_ = OutputMode::Hardware;
	CommandSink *sink_ = nullptr;
	bool hardware_driven_ = false;
	float last_steering_ = 0.0f;
	float last_throttle_ = 0.0f;
};

} // namespace control
