#include <rcd/core/Time.hpp>

#include <cerrno>
#include <time.h>

namespace rcd::core {

uint64_t Time::us() {
	timespec ts{};
	clock_gettime(CLOCK_MONOTONIC, &ts);
	return (uint64_t)ts.tv_sec * 1000000ULL + (uint64_t)ts.tv_nsec / 1000ULL;
}

uint32_t Time::ms() { return (uint32_t)(us() / 1000ULL); }

void Time::sleepMs(uint32_t ms) {
	timespec req{};
	req.tv_sec = (time_t)(ms / 1000u);
	req.tv_nsec = (long)(ms % 1000u) * 1000000L;
	// EINTR でも残り時間を寝切る
	while (nanosleep(&req, &req) != 0 && errno == EINTR) {
	}
}

} // namespace rcd::core
