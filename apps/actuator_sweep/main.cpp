// Actuator sweep (dry run)
//
// Prints the pulse / motor command table a configuration produces, without
// touching hardware. Use it to check servo endpoints, ESC neutral and motor
// polarity before connecting the car.
//
// Usage:
//   actuator_sweep [--config FILE] [--steps N] [--log FILE]
//                  [--log-level trace|debug|info|warn|error|fatal] [--verbose]

#include "config/Params.h"
#include "control/ActuatorBus.h"
#include "control/DifferentialDrive.h"
#include "control/SteeringActuator.h"
#include "control/ThrottleActuator.h"

#include <rcd/core/Log.hpp>
#include <rcd/core/Path.hpp>
#include <rcd/core/Time.hpp>
#include <rcd/hw/PwmChannel.hpp>
#include <rcd/hw/ShadowOutput.hpp>

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

namespace {

void usage(const char *argv0) {
	std::cerr << "usage: " << argv0
			  << " [--config FILE] [--steps N] [--log FILE]"
				 " [--log-level LEVEL] [--verbose]\n";
}

// Counts commands mirrored by the bus so the summary can report them.
class CountingSink final : public control::CommandSink {
public:
	void onActuatorCommand(const control::ActuatorCommand &) override {
		++count_;
	}
	uint32_t count() const { return count_; }

private:
	uint32_t count_ = 0;
};

} // namespace

int main(int argc, char **argv) {
	std::string config_path;
	std::string log_path;
	int steps = 11;
	bool verbose = false;
	bool level_set = false;
	rcd::core::LogLevel level = rcd::core::LogLevel::Info;
	for (int i = 1; i < argc; ++i) {
		std::string a = argv[i];
		if (a == "--config" && i + 1 < argc) {
			config_path = argv[++i];
		} else if (a == "--steps" && i + 1 < argc) {
			steps = std::atoi(argv[++i]);
		} else if (a == "--log" && i + 1 < argc) {
			log_path = argv[++i];
		} else if (a == "--log-level" && i + 1 < argc) {
			if (!rcd::core::parseLevel(argv[++i], level)) {
				std::cerr << "unknown log level: " << argv[i] << "\n";
				return 2;
			}
			level_set = true;
		} else if (a == "--verbose") {
			verbose = true;
		} else {
			usage(argv[0]);
			return 2;
		}
	}
	if (steps < 2) {
		std::cerr << "Invalid --steps; using 11\n";
		steps = 11;
	}

	auto &logger = rcd::core::Logger::instance();
	// --log-level が --verbose より優先
	if (!level_set && verbose)
		level = rcd::core::LogLevel::Debug;
	logger.setLevel(level);
	if (!log_path.empty()) {
		rcd::core::ensure_dir_for(log_path);
		auto file = std::make_shared< rcd::core::FileSink >(log_path);
		if (!file->isOpen()) {
			std::cerr << "cannot open log file: " << log_path << "\n";
			return 2;
		}
		logger.setConsoleEnabled(false);
		logger.addSink(file);
	}

	cfg::Params params;
	if (!config_path.empty()) {
		const rcd::Result r = cfg::loadParamsFile(config_path, params);
		if (!r.ok()) {
			logger.flush();
			std::cerr << "config error (" << rcd::errcName(r.code)
					  << "): " << r.msg << "\n";
			return 2;
		}
	} else {
		const rcd::Result r = cfg::validateParams(params);
		if (!r.ok()) {
			std::cerr << "config error: " << r.msg << "\n";
			return 2;
		}
	}
	// dry run では ESC は存在しないので待たない
	params.throttle.arm_delay_ms = 0;

	rcd::hw::ShadowPwmOutput pwm;
	rcd::hw::ShadowMotorOutput motors;

	rcd::hw::PwmChannel steer_ch(pwm, params.steering.channel);
	rcd::hw::PwmChannel throttle_ch(pwm, params.throttle.channel);
	const rcd::Result begin = steer_ch.begin(params.pwm.frequency_hz);
	if (!begin.ok()) {
		std::cerr << "pwm init failed: " << begin.msg << "\n";
		return 1;
	}

	control::SteeringActuator steering(steer_ch, params.steering);
	control::ThrottleActuator throttle(throttle_ch, params.throttle);
	control::DifferentialDrive drive(motors, params.diff);

	CountingSink car_sink;
	control::ActuatorBus car(steering, throttle);
	car.attachSink(&car_sink);
	control::ActuatorBus skid(drive);

	std::printf("%7s %7s | %6s %6s |", "steer", "thr", "pulse", "pulse");
	for (const cfg::MotorWiring &m : params.diff.wiring)
		std::printf(" m%-2u%-6s", (unsigned)m.motor_id, cfg::sideName(m.side));
	std::printf("\n");

	for (int i = 0; i < steps; ++i) {
		const float v = -1.0f + 2.0f * (float)i / (float)(steps - 1);
		// 両方を同時に振ると全象限を一通り通る
		const float st = v;
		const float th = -v;

		const uint32_t now = rcd::core::Time::ms();
		rcd::Result r = car.apply(st, th, now);
		if (r.ok())
			r = skid.apply(st, th, now);
		if (!r.ok()) {
			RCD_LOGE("sweep", std::string("apply failed: ") + r.msg);
			logger.flush();
			return 1;
		}

		std::printf("%+7.3f %+7.3f | %6u %6u |", st, th,
					(unsigned)pwm.pulse(params.steering.channel),
					(unsigned)pwm.pulse(params.throttle.channel));
		for (const cfg::MotorWiring &m : params.diff.wiring) {
			const auto s = motors.state(m.motor_id);
			std::printf(" %4u %-5s", (unsigned)s.speed, s.forward ? "fwd" : "rev");
		}
		std::printf("\n");
	}

	car.shutdown();
	skid.shutdown();
	pwm.release();

	RCD_LOGI("sweep", "done: " + std::to_string(car_sink.count()) +
						  " commands, steer neutral=" +
						  std::to_string(steering.pulseFor(0.0f)) +
						  " throttle neutral=" +
						  std::to_string(throttle.pulseFor(0.0f)));
	logger.flush();
	return 0;
}
