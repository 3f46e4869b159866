#include "column_prefix_row_lock.h"

#include <algorithm>

#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>
#include <glog/logging.h>

#include "../common/exceptions.h"

namespace Claimstone {

ColumnPrefixRowLock::ColumnPrefixRowLock(Keyspace* keyspace, ColumnFamily column_family,
                                         std::string row_key, RowLockOptions options)
    : keyspace_(keyspace),
      column_family_(std::move(column_family)),
      row_key_(std::move(row_key)),
      options_(std::move(options)),
      lock_column_(options_.column_prefix + options_.lock_id) {
    if (options_.column_prefix.empty() || options_.lock_id.empty()) {
        throw std::invalid_argument("Row lock needs a column prefix and a lock id");
    }
}

std::string ColumnPrefixRowLock::EncodeExpiry(uint64_t expiry_us) {
    return absl::StrCat(expiry_us);
}

uint64_t ColumnPrefixRowLock::DecodeExpiry(const std::string& value) {
    uint64_t expiry_us = 0;
    if (!absl::SimpleAtoi(value, &expiry_us)) {
        LOG(WARNING) << "Unreadable lock column value '" << value << "', treating as permanent";
        return 0;
    }
    return expiry_us;
}

std::string ColumnPrefixRowLock::Describe() const {
    return absl::StrCat(column_family_.name, "/", row_key_);
}

void ColumnPrefixRowLock::FillProbeMutation(MutationBatch& batch, uint64_t timestamp_us,
                                            std::optional<int> ttl_seconds) {
    uint64_t expiry_us = timestamp_us + static_cast<uint64_t>(options_.timeout.count());
    batch.WithRow(column_family_, row_key_)
        .PutColumn(lock_column_, EncodeExpiry(expiry_us), ttl_seconds);
}

void ColumnPrefixRowLock::FillCommitMutation(MutationBatch& batch) {
    batch.WithRow(column_family_, row_key_).PutColumn(lock_column_, EncodeExpiry(0));
}

void ColumnPrefixRowLock::FillReleaseMutation(MutationBatch& batch, bool exclude_current_lock) {
    RowMutation& row = batch.WithRow(column_family_, row_key_);
    for (const auto& column : locks_to_delete_) {
        row.DeleteColumn(column);
    }
    if (!exclude_current_lock) {
        row.DeleteColumn(lock_column_);
    }
    locks_to_delete_.clear();
}

absl::btree_map<std::string, uint64_t> ColumnPrefixRowLock::ReadLockColumns() {
    absl::btree_map<std::string, uint64_t> result;
    for (const auto& column : keyspace_->ReadRow(column_family_, row_key_,
                                                 options_.column_prefix,
                                                 options_.consistency_level)) {
        result.emplace(column.name, DecodeExpiry(column.value));
    }
    return result;
}

void ColumnPrefixRowLock::Verify(uint64_t timestamp_us) {
    auto lock_columns = ReadLockColumns();

    if (lock_columns.find(lock_column_) == lock_columns.end()) {
        throw StaleLockException(absl::StrCat("Lock column ", lock_column_, " on row '", Describe(),
                                              "' was superseded before verification"));
    }

    for (const auto& [column, expiry_us] : lock_columns) {
        if (column == lock_column_) {
            continue;
        }
        // A claim left behind by a writer that never committed or released
        if (expiry_us != 0 && timestamp_us > expiry_us) {
            if (options_.fail_on_stale_lock) {
                throw StaleLockException(absl::StrCat("Stale lock ", column, " on row '", Describe(),
                                                      "'. Manual cleanup required."));
            }
            VLOG(1) << "Scheduling expired lock " << column << " on " << Describe() << " for deletion";
            if (std::find(locks_to_delete_.begin(), locks_to_delete_.end(), column) ==
                locks_to_delete_.end()) {
                locks_to_delete_.push_back(column);
            }
            continue;
        }
        throw BusyLockException(absl::StrCat("Lock already acquired for row '", Describe(),
                                             "' with lock column ", column));
    }
}

} // namespace Claimstone
