#pragma once

#include <string>

namespace Claimstone {

enum class ConsistencyLevel {
	ANY,
	ONE,
	TWO,
	THREE,
	QUORUM,
	LOCAL_QUORUM,
	EACH_QUORUM,
	ALL,
	LOCAL_ONE
};

// Accepts "LOCAL_QUORUM", "local_quorum" or "CL_LOCAL_QUORUM".
// Throws std::invalid_argument for unknown names.
ConsistencyLevel parseConsistencyLevel(const std::string& value);

std::string ConsistencyLevelName(ConsistencyLevel level);

// Number of replica acknowledgements the level needs with the given
// replication factor. Throws StorageException if it can never be satisfied.
int RequiredReplicas(ConsistencyLevel level, int replication_factor);

} // namespace Claimstone
