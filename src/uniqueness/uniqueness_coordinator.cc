#include "uniqueness_coordinator.h"

#include <stdexcept>

#include <absl/strings/str_join.h>
#include <glog/logging.h>

#include "probe_token.h"
#include "../common/exceptions.h"
#include "../locks/column_prefix_row_lock.h"

namespace Claimstone {

std::string AttemptStateName(AttemptState state) {
    switch (state) {
        case AttemptState::IDLE: return "IDLE";
        case AttemptState::PROBES_WRITTEN: return "PROBES_WRITTEN";
        case AttemptState::VERIFIED: return "VERIFIED";
        case AttemptState::COMMITTED: return "COMMITTED";
        case AttemptState::ROLLING_BACK: return "ROLLING_BACK";
        case AttemptState::RELEASED: return "RELEASED";
    }
    return "UNKNOWN";
}

namespace {

UniquenessOptions CheckedOptions(UniquenessOptions options) {
    std::vector<std::string> errors = options.Validate();
    if (!errors.empty()) {
        throw std::invalid_argument("Invalid uniqueness options: " + absl::StrJoin(errors, "; "));
    }
    return options;
}

} // namespace

UniquenessCoordinator::UniquenessCoordinator(Keyspace* keyspace, UniquenessOptions options)
    : keyspace_(keyspace),
      options_(CheckedOptions(std::move(options))),
      probe_token_(options_.probe_token.has_value() ? *options_.probe_token : GenerateProbeToken()) {
    if (keyspace_ == nullptr) {
        throw std::invalid_argument("UniquenessCoordinator needs a keyspace");
    }
    for (const auto& row : options_.rows) {
        AddRow(row.column_family, row.row_key);
    }
}

void UniquenessCoordinator::ensureNotStarted(const char* operation) const {
    if (started_) {
        throw std::logic_error(std::string(operation) + " called after uniqueness attempt " +
                               probe_token_ + " started");
    }
}

UniquenessCoordinator& UniquenessCoordinator::AddRow(const ColumnFamily& column_family,
                                                     const std::string& row_key) {
    ensureNotStarted("AddRow");
    RowLockOptions lock_options;
    lock_options.column_prefix = options_.column_prefix;
    lock_options.lock_id = probe_token_;
    lock_options.consistency_level = options_.consistency_level;
    lock_options.timeout = options_.lock_timeout;
    lock_options.fail_on_stale_lock = options_.fail_on_stale_lock;
    locks_.push_back(std::make_unique<ColumnPrefixRowLock>(keyspace_, column_family, row_key,
                                                           std::move(lock_options)));
    return *this;
}

UniquenessCoordinator& UniquenessCoordinator::AddParticipant(std::unique_ptr<IRowLock> lock) {
    ensureNotStarted("AddParticipant");
    if (!lock) {
        throw std::invalid_argument("Participant lock must not be null");
    }
    locks_.push_back(std::move(lock));
    return *this;
}

MutationBatch UniquenessCoordinator::prepareBatch() {
    MutationBatch batch = keyspace_->PrepareMutationBatch();
    batch.SetConsistencyLevel(options_.consistency_level);
    return batch;
}

void UniquenessCoordinator::Acquire() {
    AcquireAndApplyMutation(nullptr);
}

void UniquenessCoordinator::AcquireAndMutate(const MutationBatch& mutation) {
    AcquireAndApplyMutation([&mutation](MutationBatch& batch) {
        batch.MergeShallow(mutation);
    });
}

void UniquenessCoordinator::AcquireAndApplyMutation(const MutationCallback& callback) {
    ensureNotStarted("Acquire");
    if (locks_.empty()) {
        throw std::logic_error("Uniqueness attempt needs at least one row");
    }
    started_ = true;

    // Every row is probed and verified against the same instant
    uint64_t now = keyspace_->NowMicros();

    // The batch lands on all rows or none, so a failure here leaves nothing to release
    MutationBatch probe = prepareBatch();
    probe.SetTimestamp(now);
    for (auto& lock : locks_) {
        lock->FillProbeMutation(probe, now, options_.ttl_seconds);
    }
    probe.Execute();
    state_ = AttemptState::PROBES_WRITTEN;
    VLOG(1) << "Attempt " << probe_token_ << " probed " << locks_.size() << " rows at " << now;

    const IRowLock* current = nullptr;
    try {
        for (auto& lock : locks_) {
            current = lock.get();
            lock->Verify(now);
            VLOG(2) << "Attempt " << probe_token_ << " verified " << lock->Describe();
        }
        current = nullptr;
        state_ = AttemptState::VERIFIED;

        MutationBatch commit = prepareBatch();
        for (auto& lock : locks_) {
            lock->FillCommitMutation(commit);
        }
        if (callback) {
            callback(commit);
        }
        commit.Execute();
        state_ = AttemptState::COMMITTED;
    } catch (const BusyLockException& e) {
        rollBack(e.what());
        throw NotUniqueException(current ? current->Describe() : "", e.what());
    } catch (const StaleLockException& e) {
        rollBack(e.what());
        throw NotUniqueException(current ? current->Describe() : "", e.what());
    } catch (const std::exception& e) {
        rollBack(e.what());
        throw;
    } catch (...) {
        rollBack("non-standard exception");
        throw;
    }

    LOG(INFO) << "Attempt " << probe_token_ << " committed uniqueness over " << locks_.size() << " rows";
}

void UniquenessCoordinator::rollBack(const std::string& cause) {
    state_ = AttemptState::ROLLING_BACK;
    LOG(WARNING) << "Attempt " << probe_token_ << " failed: " << cause << ". Releasing "
                 << locks_.size() << " rows";
    try {
        Release();
    } catch (const std::exception& e) {
        // The caller gets the original failure; the probes expire with their TTL
        LOG(ERROR) << "Release of attempt " << probe_token_ << " failed: " << e.what();
    }
}

void UniquenessCoordinator::Release() {
    MutationBatch batch = prepareBatch();
    for (auto& lock : locks_) {
        lock->FillReleaseMutation(batch, false);
    }
    batch.Execute();
    state_ = AttemptState::RELEASED;
    VLOG(1) << "Attempt " << probe_token_ << " released " << locks_.size() << " rows";
}

} // namespace Claimstone
