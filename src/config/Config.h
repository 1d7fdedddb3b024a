#pragma once

#include <cstdint>

namespace cfg {
// clang-format off

//------------------------------------------------------------------------------
// 正規化コマンド（steering / throttle 共通）
//------------------------------------------------------------------------------
static constexpr float CMD_MIN = -1.0f;
static constexpr float CMD_MAX = 1.0f;

//------------------------------------------------------------------------------
// PWM ボード（12bit, PCA9685 相当）
//------------------------------------------------------------------------------
static constexpr uint16_t PWM_PULSE_MAX        = 4095;
static constexpr uint16_t PWM_FREQ_MIN_HZ      = 24;
static constexpr uint16_t PWM_FREQ_MAX_HZ      = 1526;
static constexpr uint16_t DEFAULT_PWM_FREQ_HZ  = 60;
static constexpr uint8_t  PWM_CHANNEL_COUNT    = 16; // channel 0..15

//------------------------------------------------------------------------------
// Steering servo
//------------------------------------------------------------------------------
static constexpr uint8_t  DEFAULT_STEER_CHANNEL     = 1;
static constexpr uint16_t DEFAULT_STEER_LEFT_PULSE  = 290;
static constexpr uint16_t DEFAULT_STEER_RIGHT_PULSE = 490;

//------------------------------------------------------------------------------
// Throttle ESC
//------------------------------------------------------------------------------
static constexpr uint8_t  DEFAULT_THROTTLE_CHANNEL   = 0;
static constexpr uint16_t DEFAULT_THROTTLE_MAX_PULSE = 300; // 前進最大
static constexpr uint16_t DEFAULT_THROTTLE_MIN_PULSE = 490; // 後退最大
static constexpr uint16_t DEFAULT_THROTTLE_ZERO_PULSE = 350;
// ESC アーミング（zero pulse を送ってから待つ時間）
static constexpr uint32_t DEFAULT_ESC_ARM_DELAY_MS   = 1000;

//------------------------------------------------------------------------------
// Differential drive（4 モータ, 左右 2 個ずつ）
//------------------------------------------------------------------------------
static constexpr uint16_t DEFAULT_DIFF_SPEED_SCALE = 100; // percent
static constexpr uint16_t DEFAULT_DC_MOTOR_SPEED_SCALE = 255; // 8bit duty
static constexpr int DIFF_MOTOR_COUNT = 4;
static constexpr uint8_t MOTOR_ID_LIMIT = 8; // motor board が受け付ける id は 0..7

// clang-format on
} // namespace cfg
