#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "../locks/column_prefix_row_lock.h"
#include "../storage/column.h"
#include "../storage/consistency_level.h"

namespace Claimstone {

class Configuration;

// One row taking part in a uniqueness attempt.
struct Participant {
    ColumnFamily column_family;
    std::string row_key;
};

/**
 * Everything a uniqueness attempt needs, fixed when the coordinator is
 * constructed. Rows may also be appended through the coordinator until the
 * attempt starts.
 */
struct UniquenessOptions {
    // Verified in this order
    std::vector<Participant> rows;
    // Probe columns only; committed claims never expire
    std::optional<int> ttl_seconds;
    ConsistencyLevel consistency_level = ConsistencyLevel::LOCAL_QUORUM;
    std::string column_prefix = kDefaultLockPrefix;
    // Generated when unset
    std::optional<std::string> probe_token;
    std::chrono::microseconds lock_timeout = kDefaultLockTimeout;
    bool fail_on_stale_lock = false;

    // Empty when the options are usable.
    std::vector<std::string> Validate() const;

    // Defaults from the uniqueness section of the configuration. Rows are left empty.
    static UniquenessOptions FromConfig(const Configuration& config);
};

} // namespace Claimstone
