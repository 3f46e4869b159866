#include "probe_token.h"

#include <algorithm>
#include <atomic>
#include <chrono>

#include <absl/random/random.h>
#include <absl/strings/numbers.h>
#include <absl/strings/str_format.h>

namespace Claimstone {

namespace {

// 100ns intervals between the UUID epoch (1582-10-15) and the Unix epoch
constexpr uint64_t kUuidEpochOffset = 0x01B21DD213814000ULL;

struct NodeIdentity {
	uint16_t clock_seq;
	uint64_t node;
};

const NodeIdentity& GetNodeIdentity() {
	static const NodeIdentity identity = []() {
		absl::BitGen gen;
		NodeIdentity id;
		id.clock_seq = absl::Uniform<uint16_t>(gen) & 0x3FFF;
		// Random node ids set the multicast bit so they never collide with a MAC
		id.node = (absl::Uniform<uint64_t>(gen) & 0xFFFFFFFFFFFFULL) | 0x010000000000ULL;
		return id;
	}();
	return identity;
}

std::atomic<uint64_t> last_micros{0};

} // namespace

uint64_t UniqueTimeMicros() {
	uint64_t now = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::microseconds>(
			std::chrono::system_clock::now().time_since_epoch()).count());
	uint64_t last = last_micros.load(std::memory_order_relaxed);
	uint64_t next;
	do {
		next = std::max(now, last + 1);
	} while (!last_micros.compare_exchange_weak(last, next, std::memory_order_acq_rel,
				std::memory_order_relaxed));
	return next;
}

std::string GenerateProbeToken() {
	return ProbeTokenForMicros(UniqueTimeMicros());
}

std::string ProbeTokenForMicros(uint64_t micros) {
	const NodeIdentity& identity = GetNodeIdentity();
	uint64_t timestamp = micros * 10 + kUuidEpochOffset;

	uint32_t time_low = static_cast<uint32_t>(timestamp & 0xFFFFFFFFULL);
	uint16_t time_mid = static_cast<uint16_t>((timestamp >> 32) & 0xFFFF);
	uint16_t time_hi_version = static_cast<uint16_t>(((timestamp >> 48) & 0x0FFF) | 0x1000);
	uint16_t clock_seq_variant = static_cast<uint16_t>(identity.clock_seq | 0x8000);

	return absl::StrFormat("%08x-%04x-%04x-%04x-%012x", time_low, time_mid, time_hi_version,
			clock_seq_variant, identity.node);
}

std::optional<uint64_t> ProbeTokenTimestampMicros(const std::string& token) {
	if (token.size() != 36 || token[8] != '-' || token[13] != '-' || token[18] != '-' ||
			token[23] != '-') {
		return std::nullopt;
	}

	uint32_t time_low = 0;
	uint32_t time_mid = 0;
	uint32_t time_hi_version = 0;
	if (!absl::SimpleHexAtoi(token.substr(0, 8), &time_low) ||
			!absl::SimpleHexAtoi(token.substr(9, 4), &time_mid) ||
			!absl::SimpleHexAtoi(token.substr(14, 4), &time_hi_version)) {
		return std::nullopt;
	}
	if ((time_hi_version >> 12) != 1) {
		return std::nullopt;
	}

	uint64_t timestamp = (static_cast<uint64_t>(time_hi_version & 0x0FFF) << 48) |
		(static_cast<uint64_t>(time_mid) << 32) | time_low;
	if (timestamp < kUuidEpochOffset) {
		return std::nullopt;
	}
	return (timestamp - kUuidEpochOffset) / 10;
}

} // namespace Claimstone
