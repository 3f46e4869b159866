#pragma once

#include <memory>
#include <string>
#include <vector>

#include "uniqueness_constraint.h"
#include "uniqueness_options.h"
#include "../locks/row_lock.h"
#include "../storage/keyspace.h"

namespace Claimstone {

enum class AttemptState {
    IDLE,
    PROBES_WRITTEN,
    VERIFIED,
    COMMITTED,
    ROLLING_BACK,
    RELEASED
};

std::string AttemptStateName(AttemptState state);

/**
 * Checks uniqueness over several rows at once:
 *  1. Write a probe column carrying the same token to every row in a single
 *     batch, with an optional TTL in case the client dies before committing.
 *  2. Read the claim columns of each row back, in order, and make sure ours
 *     is the only valid one. Stops at the first conflicting row.
 *  3. Rewrite the claim columns without TTL, together with any writes the
 *     caller attaches to the commit batch.
 * A failure after step 1 releases the probes before the error reaches the
 * caller.
 *
 * Not thread safe. One instance runs one attempt; retry with a new instance.
 */
class UniquenessCoordinator : public IUniquenessConstraint {
public:
    // Throws std::invalid_argument listing every problem with |options|.
    UniquenessCoordinator(Keyspace* keyspace, UniquenessOptions options);

    UniquenessCoordinator(const UniquenessCoordinator&) = delete;
    UniquenessCoordinator& operator=(const UniquenessCoordinator&) = delete;

    // Both throw std::logic_error once the attempt has started.
    UniquenessCoordinator& AddRow(const ColumnFamily& column_family, const std::string& row_key);
    UniquenessCoordinator& AddParticipant(std::unique_ptr<IRowLock> lock);

    void Acquire() override;
    void AcquireAndApplyMutation(const MutationCallback& callback) override;

    // Commits |mutation| together with the claim.
    void AcquireAndMutate(const MutationBatch& mutation);

    // Best effort cleanup of this attempt's claim on every row. Safe to call
    // more than once, and before or after Acquire().
    void Release() override;

    const std::string& GetProbeToken() const { return probe_token_; }
    AttemptState GetState() const { return state_; }
    size_t GetParticipantCount() const { return locks_.size(); }
    const UniquenessOptions& options() const { return options_; }

private:
    MutationBatch prepareBatch();
    void ensureNotStarted(const char* operation) const;
    void rollBack(const std::string& cause);

    Keyspace* keyspace_;
    const UniquenessOptions options_;
    const std::string probe_token_;
    std::vector<std::unique_ptr<IRowLock>> locks_;
    AttemptState state_ = AttemptState::IDLE;
    bool started_ = false;
};

} // namespace Claimstone
