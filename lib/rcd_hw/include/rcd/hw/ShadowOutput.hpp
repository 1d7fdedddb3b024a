#pragma once
#include <rcd/hw/MotorOutput.hpp>
#include <rcd/hw/PwmOutput.hpp>

#include <array>
#include <cstdint>

namespace rcd::hw {

// Dry-run PWM board: records and logs every command, touches no hardware.
class ShadowPwmOutput final : public IPwmOutput {
public:
	static constexpr uint8_t kChannels = 16;

	Result setFrequency(uint16_t hz) override;
	Result setPulse(uint8_t channel, uint16_t pulse) override;
	void release() override;

	uint16_t frequency() const { return frequency_; }
	uint16_t pulse(uint8_t channel) const;
	uint32_t writes() const { return writes_; }
	bool released() const { return released_; }

private:
	uint16_t frequency_ = 0;
	std::array< uint16_t, kChannels > pulses_{};
	uint32_t writes_ = 0;
	bool released_ = false;
};

// Dry-run DC motor board.
class ShadowMotorOutput final : public IMotorOutput {
public:
	static constexpr uint8_t kMotors = 8;

	struct State {
		uint16_t speed = 0;
		bool forward = false;
		bool running = false;
	};

	void runMotor(uint8_t motor_id, uint16_t speed, bool forward) override;
	void release(uint8_t motor_id) override;

	State state(uint8_t motor_id) const;

private:
	std::array< State, kMotors > motors_{};
};

} // namespace rcd::hw
