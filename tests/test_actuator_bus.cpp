#include "doctest/doctest.h"

#include "config/Params.h"
#include "control/ActuatorBus.h"
#include "fakes/FakeOutputs.h"

#include <rcd/hw/PwmChannel.hpp>

#include <vector>

namespace {

struct RecordingSink final : control::CommandSink {
	void onActuatorCommand(const control::ActuatorCommand &cmd) override {
		cmds.push_back(cmd);
	}
	std::vector< control::ActuatorCommand > cmds;
};

struct Car {
	fakes::FakePwmOutput pwm;
	rcd::hw::PwmChannel steer_ch{pwm, 1};
	rcd::hw::PwmChannel throttle_ch{pwm, 0};
	control::SteeringActuator steering{steer_ch, cfg::SteeringParams{}};
	control::ThrottleActuator throttle{throttle_ch, params()};

	static cfg::ThrottleParams params() {
		cfg::ThrottleParams p;
		p.arm_delay_ms = 0;
		return p;
	}

	uint16_t pulseOn(uint8_t channel) const {
		for (auto it = pwm.writes.rbegin(); it != pwm.writes.rend(); ++it) {
			if (it->channel == channel)
				return it->pulse;
		}
		return 0;
	}
};

} // namespace

TEST_CASE("ActuatorBus routes to servo and ESC") {
	Car car;
	control::ActuatorBus bus(car.steering, car.throttle);
	CHECK(bus.layout() == control::Layout::ServoEsc);

	REQUIRE(bus.apply(-1.0f, 1.0f, 10).ok());
	CHECK(car.pulseOn(1) == 290);
	CHECK(car.pulseOn(0) == 300);
	CHECK(bus.lastSteering() == -1.0f);
	CHECK(bus.lastThrottle() == 1.0f);
}

TEST_CASE("ActuatorBus validates the pair before actuating either side") {
	Car car;
	control::ActuatorBus bus(car.steering, car.throttle);
	const size_t before = car.pwm.writes.size();

	CHECK(bus.apply(0.5f, 1.5f, 0).code == rcd::Errc::InvalidCommand);
	CHECK(bus.apply(-4.0f, 0.0f, 0).code == rcd::Errc::InvalidCommand);
	CHECK(car.pwm.writes.size() == before);
}

TEST_CASE("ActuatorBus routes to the differential drive") {
	fakes::FakeMotorOutput motors;
	control::DifferentialDrive drive(motors, cfg::DifferentialParams{});
	control::ActuatorBus bus(drive);
	CHECK(bus.layout() == control::Layout::Differential);

	REQUIRE(bus.apply(0.25f, 0.5f, 0).ok());
	CHECK(motors.runs.size() == 4);
	CHECK(motors.last(1)->speed == 50);
	CHECK(motors.last(3)->speed == 25);

	bus.shutdown();
	CHECK(motors.released.size() == 4);
}

TEST_CASE("ActuatorBus shadow mode mirrors without driving hardware") {
	Car car;
	RecordingSink sink;
	control::ActuatorBus bus(car.steering, car.throttle);
	bus.attachSink(&sink);
	bus.setOutputMode(control::OutputMode::Shadow);
	const size_t before = car.pwm.writes.size();

	REQUIRE(bus.apply(0.25f, -0.5f, 1234).ok());
	CHECK(car.pwm.writes.size() == before);
	REQUIRE(sink.cmds.size() == 1);
	CHECK(sink.cmds[0].now_ms == 1234);
	CHECK(sink.cmds[0].steering == 0.25f);
	CHECK(sink.cmds[0].throttle == -0.5f);

	bus.shutdown();
	CHECK(car.pwm.writes.size() == before);
}

TEST_CASE("ActuatorBus shutdown returns to neutral") {
	Car car;
	control::ActuatorBus bus(car.steering, car.throttle);
	REQUIRE(bus.apply(1.0f, 1.0f, 0).ok());

	bus.shutdown();
	CHECK(car.pulseOn(1) == 390);
	CHECK(car.pulseOn(0) == 350);
	CHECK(bus.lastThrottle() == 0.0f);
}

TEST_CASE("ActuatorBus shutdown neutralizes after switching to shadow mode") {
	Car car;
	control::ActuatorBus bus(car.steering, car.throttle);
	REQUIRE(bus.apply(1.0f, 1.0f, 0).ok());
	REQUIRE(car.pulseOn(0) == 300);
	REQUIRE(car.pulseOn(1) == 490);

	bus.setOutputMode(control::OutputMode::Shadow);
	bus.shutdown();
	CHECK(car.pulseOn(0) == 350);
	CHECK(car.pulseOn(1) == 390);
}

TEST_CASE("ActuatorBus shutdown releases motors after switching to shadow mode") {
	fakes::FakeMotorOutput motors;
	control::DifferentialDrive drive(motors, cfg::DifferentialParams{});
	control::ActuatorBus bus(drive);
	REQUIRE(bus.apply(0.0f, 0.8f, 0).ok());

	bus.setOutputMode(control::OutputMode::Shadow);
	bus.shutdown();
	CHECK(motors.released.size() == 4);
}
