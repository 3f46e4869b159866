#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace Claimstone {

// Microseconds since the epoch, strictly increasing across calls within the
// process. Two calls in the same microsecond get consecutive values.
uint64_t UniqueTimeMicros();

// Time-based (version 1) UUID string built from UniqueTimeMicros(), a random
// per-process clock sequence and a random multicast node id.
std::string GenerateProbeToken();

// Same layout, for a caller-chosen timestamp.
std::string ProbeTokenForMicros(uint64_t micros);

// Recovers the microsecond timestamp of a token produced by the functions
// above. Returns nullopt for anything that is not a version 1 UUID.
std::optional<uint64_t> ProbeTokenTimestampMicros(const std::string& token);

} // namespace Claimstone
