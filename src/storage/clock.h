#ifndef CLAIMSTONE_SRC_STORAGE_CLOCK_H_
#define CLAIMSTONE_SRC_STORAGE_CLOCK_H_

#include <atomic>
#include <cstdint>

namespace Claimstone {

/**
 * Source of write timestamps and TTL expiry checks, in microseconds since
 * the Unix epoch.
 */
class Clock {
public:
	virtual ~Clock() = default;
	virtual uint64_t NowMicros() const = 0;
};

class SystemClock : public Clock {
public:
	uint64_t NowMicros() const override;
};

// Clock that only moves when told to. Used to drive TTL expiry without sleeping.
class ManualClock : public Clock {
public:
	explicit ManualClock(uint64_t start_micros = 1'000'000'000'000'000ULL)
		: now_micros_(start_micros) {}

	uint64_t NowMicros() const override {
		return now_micros_.load(std::memory_order_acquire);
	}

	void SetMicros(uint64_t micros) {
		now_micros_.store(micros, std::memory_order_release);
	}

	void AdvanceMicros(uint64_t delta) {
		now_micros_.fetch_add(delta, std::memory_order_acq_rel);
	}

	void AdvanceSeconds(uint64_t seconds) {
		AdvanceMicros(seconds * 1000000ULL);
	}

private:
	std::atomic<uint64_t> now_micros_;
};

} // namespace Claimstone

#endif // CLAIMSTONE_SRC_STORAGE_CLOCK_H_
