#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "../storage/mutation_batch.h"

namespace Claimstone {

/**
 * Per-row claim primitive driven by the uniqueness coordinator.
 * Implementations own the encoding of their claim columns.
 */
class IRowLock {
public:
    virtual ~IRowLock() = default;

    // Adds the provisional claim, written at |timestamp_us| and expiring after
    // |ttl_seconds| when set.
    virtual void FillProbeMutation(MutationBatch& batch, uint64_t timestamp_us,
                                   std::optional<int> ttl_seconds) = 0;

    // Throws BusyLockException if another valid claim exists on the row, or
    // StaleLockException if this claim is no longer the one stored.
    virtual void Verify(uint64_t timestamp_us) = 0;

    // Adds the permanent (TTL-less) claim.
    virtual void FillCommitMutation(MutationBatch& batch) = 0;

    // Adds the deletes that clear this claim (unless |exclude_current_lock|)
    // and any expired claims discovered by Verify().
    virtual void FillReleaseMutation(MutationBatch& batch, bool exclude_current_lock) = 0;

    virtual std::string Describe() const = 0;
};

} // namespace Claimstone
