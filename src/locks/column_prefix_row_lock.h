#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include <absl/container/btree_map.h>

#include "row_lock.h"
#include "../storage/column.h"
#include "../storage/consistency_level.h"
#include "../storage/keyspace.h"

namespace Claimstone {

inline constexpr char kDefaultLockPrefix[] = "_LOCK_";
inline constexpr std::chrono::microseconds kDefaultLockTimeout = std::chrono::seconds(60);

struct RowLockOptions {
    // Distinguishes claim columns from data columns in the same row
    std::string column_prefix = kDefaultLockPrefix;
    std::string lock_id;
    ConsistencyLevel consistency_level = ConsistencyLevel::LOCAL_QUORUM;
    // How long a probe stays a valid claim, encoded into the column value
    std::chrono::microseconds timeout = kDefaultLockTimeout;
    // Treat expired leftover claims as a verification failure instead of
    // cleaning them up on release
    bool fail_on_stale_lock = false;
};

/**
 * Row claim stored as one column named <prefix><lock id>. The column value is
 * the claim's expiry time in microseconds, or 0 for a permanent claim. A row
 * is held by us when ours is the only unexpired column under the prefix.
 */
class ColumnPrefixRowLock : public IRowLock {
public:
    ColumnPrefixRowLock(Keyspace* keyspace, ColumnFamily column_family,
                        std::string row_key, RowLockOptions options);

    void FillProbeMutation(MutationBatch& batch, uint64_t timestamp_us,
                           std::optional<int> ttl_seconds) override;
    void Verify(uint64_t timestamp_us) override;
    void FillCommitMutation(MutationBatch& batch) override;
    void FillReleaseMutation(MutationBatch& batch, bool exclude_current_lock) override;
    std::string Describe() const override;

    // Claim columns currently stored on the row, mapped to their expiry value.
    absl::btree_map<std::string, uint64_t> ReadLockColumns();

    const std::string& GetLockColumn() const { return lock_column_; }
    const std::vector<std::string>& GetLocksToDelete() const { return locks_to_delete_; }
    const RowLockOptions& options() const { return options_; }

    static std::string EncodeExpiry(uint64_t expiry_us);
    // Values that do not parse are treated as permanent claims.
    static uint64_t DecodeExpiry(const std::string& value);

private:
    Keyspace* keyspace_;
    ColumnFamily column_family_;
    std::string row_key_;
    RowLockOptions options_;
    std::string lock_column_;
    std::vector<std::string> locks_to_delete_;
};

} // namespace Claimstone
