#include "clock.h"

#include <chrono>

namespace Claimstone {

uint64_t SystemClock::NowMicros() const {
	return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::microseconds>(
			std::chrono::system_clock::now().time_since_epoch()).count());
}

} // namespace Claimstone
