#include "config/Params.h"

#include <rcd/core/Log.hpp>

#include <cerrno>
#include <cstdlib>
#include <fstream>

namespace cfg {

using rcd::Errc;
using rcd::Result;

namespace {

bool pulseInRange(uint16_t pulse) { return pulse <= PWM_PULSE_MAX; }

bool parseUnsigned(const std::string &s, unsigned long max, unsigned long &out) {
	if (s.empty() || s[0] == '-' || s[0] == '+')
		return false;
	const char *p = s.c_str();
	char *end = nullptr;
	errno = 0;
	const unsigned long v = std::strtoul(p, &end, 10);
	if (end == p || *end != '\0' || errno == ERANGE || v > max)
		return false;
	out = v;
	return true;
}

bool parseBool(const std::string &s, bool &out) {
	if (s == "1" || s == "true" || s == "yes") {
		out = true;
		return true;
	}
	if (s == "0" || s == "false" || s == "no") {
		out = false;
		return true;
	}
	return false;
}

bool parseSide(const std::string &s, Side &out) {
	if (s == "left") {
		out = Side::Left;
		return true;
	}
	if (s == "right") {
		out = Side::Right;
		return true;
	}
	return false;
}

std::string trim(const std::string &s) {
	const char *ws = " \t\r\n";
	const size_t b = s.find_first_not_of(ws);
	if (b == std::string::npos)
		return std::string();
	const size_t e = s.find_last_not_of(ws);
	return s.substr(b, e - b + 1);
}

template < typename T >
Result setUnsigned(const std::string &value, unsigned long max, T &field) {
	unsigned long v = 0;
	if (!parseUnsigned(value, max, v))
		return Result::Fail(Errc::InvalidConfig, "malformed number");
	field = (T)v;
	return Result::Ok();
}

// "diff.motor<N>.<field>"
Result applyWiring(const std::string &key, const std::string &value,
				   DifferentialParams &diff) {
	static const std::string prefix = "diff.motor";
	const size_t dot = key.find('.', prefix.size());
	if (dot == std::string::npos || dot == prefix.size())
		return Result::Fail(Errc::InvalidConfig, "unknown key");
	unsigned long idx = 0;
	if (!parseUnsigned(key.substr(prefix.size(), dot - prefix.size()),
					   DIFF_MOTOR_COUNT - 1, idx))
		return Result::Fail(Errc::InvalidConfig, "motor index out of range");

	MotorWiring &w = diff.wiring[idx];
	const std::string field = key.substr(dot + 1);
	if (field == "id")
		return setUnsigned(value, 255, w.motor_id);
	if (field == "side") {
		if (!parseSide(value, w.side))
			return Result::Fail(Errc::InvalidConfig, "side must be left/right");
		return Result::Ok();
	}
	if (field == "inverted") {
		if (!parseBool(value, w.inverted))
			return Result::Fail(Errc::InvalidConfig, "malformed bool");
		return Result::Ok();
	}
	return Result::Fail(Errc::InvalidConfig, "unknown key");
}

} // namespace

const char *sideName(Side s) { return s == Side::Left ? "left" : "right"; }

Result validateSteering(const SteeringParams &p) {
	if (!pulseInRange(p.left_pulse) || !pulseInRange(p.right_pulse))
		return Result::Fail(Errc::InvalidConfig, "steering pulse out of range");
	// 向きはどちらでもよいが、同値だと写像が潰れる
	if (p.left_pulse == p.right_pulse)
		return Result::Fail(Errc::InvalidConfig,
							"steering left_pulse == right_pulse");
	return Result::Ok();
}

Result validateThrottle(const ThrottleParams &p) {
	if (!pulseInRange(p.max_pulse) || !pulseInRange(p.min_pulse) ||
		!pulseInRange(p.zero_pulse))
		return Result::Fail(Errc::InvalidConfig, "throttle pulse out of range");
	if (p.zero_pulse == p.max_pulse || p.zero_pulse == p.min_pulse)
		return Result::Fail(Errc::InvalidConfig,
							"throttle zero_pulse must differ from min/max");
	return Result::Ok();
}

Result validateDifferential(const DifferentialParams &p) {
	if (p.speed_scale == 0)
		return Result::Fail(Errc::InvalidConfig, "diff speed_scale is zero");
	bool has_left = false;
	bool has_right = false;
	for (size_t i = 0; i < p.wiring.size(); ++i) {
		if (p.wiring[i].motor_id >= MOTOR_ID_LIMIT)
			return Result::Fail(Errc::InvalidConfig, "motor id out of range");
		for (size_t j = i + 1; j < p.wiring.size(); ++j) {
			if (p.wiring[i].motor_id == p.wiring[j].motor_id)
				return Result::Fail(Errc::InvalidConfig,
									"duplicate motor id in wiring");
		}
		if (p.wiring[i].side == Side::Left)
			has_left = true;
		else
			has_right = true;
	}
	if (!has_left || !has_right)
		return Result::Fail(Errc::InvalidConfig,
							"each side needs at least one motor");
	return Result::Ok();
}

Result validateParams(const Params &p) {
	if (p.pwm.frequency_hz < PWM_FREQ_MIN_HZ ||
		p.pwm.frequency_hz > PWM_FREQ_MAX_HZ)
		return Result::Fail(Errc::InvalidConfig, "pwm frequency out of range");
	if (p.steering.channel >= PWM_CHANNEL_COUNT ||
		p.throttle.channel >= PWM_CHANNEL_COUNT)
		return Result::Fail(Errc::InvalidConfig, "pwm channel out of range");
	if (p.steering.channel == p.throttle.channel)
		return Result::Fail(Errc::InvalidConfig,
							"steering and throttle share a channel");
	Result r = validateSteering(p.steering);
	if (!r.ok())
		return r;
	r = validateThrottle(p.throttle);
	if (!r.ok())
		return r;
	return validateDifferential(p.diff);
}

Result applyParam(const std::string &key, const std::string &value,
				  Params &out) {
	Params tmp = out;
	Result r = Result::Fail(Errc::InvalidConfig, "unknown key");

	if (key == "pwm.frequency_hz")
		r = setUnsigned(value, 0xFFFF, tmp.pwm.frequency_hz);
	else if (key == "steering.channel")
		r = setUnsigned(value, 255, tmp.steering.channel);
	else if (key == "steering.left_pulse")
		r = setUnsigned(value, 0xFFFF, tmp.steering.left_pulse);
	else if (key == "steering.right_pulse")
		r = setUnsigned(value, 0xFFFF, tmp.steering.right_pulse);
	else if (key == "throttle.channel")
		r = setUnsigned(value, 255, tmp.throttle.channel);
	else if (key == "throttle.max_pulse")
		r = setUnsigned(value, 0xFFFF, tmp.throttle.max_pulse);
	else if (key == "throttle.min_pulse")
		r = setUnsigned(value, 0xFFFF, tmp.throttle.min_pulse);
	else if (key == "throttle.zero_pulse")
		r = setUnsigned(value, 0xFFFF, tmp.throttle.zero_pulse);
	else if (key == "throttle.arm_delay_ms")
		r = setUnsigned(value, 60000, tmp.throttle.arm_delay_ms);
	else if (key == "diff.speed_scale")
		r = setUnsigned(value, 0xFFFF, tmp.diff.speed_scale);
	else if (key.compare(0, 10, "diff.motor") == 0)
		r = applyWiring(key, value, tmp.diff);

	if (r.ok())
		out = tmp;
	return r;
}

Result loadParamsFile(const std::string &path, Params &out) {
	std::ifstream in(path);
	if (!in) {
		RCD_LOGE("cfg", "cannot open " + path);
		return Result::Fail(Errc::Internal, "cannot open config file");
	}

	Params tmp = out;
	std::string line;
	int lineno = 0;
	while (std::getline(in, line)) {
		++lineno;
		const size_t hash = line.find('#');
		if (hash != std::string::npos)
			line.erase(hash);
		line = trim(line);
		if (line.empty())
			continue;

		const size_t eq = line.find('=');
		if (eq == std::string::npos) {
			RCD_LOGE("cfg", path + ":" + std::to_string(lineno) +
								": expected key = value");
			return Result::Fail(Errc::InvalidConfig, "expected key = value");
		}
		const std::string key = trim(line.substr(0, eq));
		const std::string value = trim(line.substr(eq + 1));
		const Result r = applyParam(key, value, tmp);
		if (!r.ok()) {
			RCD_LOGE("cfg", path + ":" + std::to_string(lineno) + ": " + key +
								": " + r.msg);
			return r;
		}
	}

	const Result v = validateParams(tmp);
	if (!v.ok()) {
		RCD_LOGE("cfg", path + ": " + v.msg);
		return v;
	}
	out = tmp;
	RCD_LOGI("cfg", "loaded " + path);
	return Result::Ok();
}

} // namespace cfg
