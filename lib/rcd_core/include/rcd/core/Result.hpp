#pragma once
#include <cstdint>

namespace rcd {

enum class Errc : uint8_t {
	Ok = 0,
	InvalidCommand, // steering/throttle outside [-1, 1]
	IoFailure,      // bus write failed
	NotReady,       // driver hardware missing or unreachable
	InvalidConfig,
	Internal
};

struct Result {
	Errc code;
	const char *msg;

	constexpr bool ok() const { return code == Errc::Ok; }

	static constexpr Result Ok() { return {Errc::Ok, ""}; }
	static constexpr Result Fail(Errc c, const char *m) { return {c, m}; }
};

inline const char *errcName(Errc c) {
	switch (c) {
	case Errc::Ok:
		return "Ok";
	case Errc::InvalidCommand:
		return "InvalidCommand";
	case Errc::IoFailure:
		return "IoFailure";
	case Errc::NotReady:
		return "NotReady";
	case Errc::InvalidConfig:
		return "InvalidConfig";
	case Errc::Internal:
		return "Internal";
	}
	return "?";
}

} // namespace rcd
