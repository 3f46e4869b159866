#include "replicated_keyspace.h"

#include <algorithm>
#include <stdexcept>

#include <absl/container/flat_hash_map.h>
#include <absl/strings/str_cat.h>
#include <glog/logging.h>

#include "../common/exceptions.h"

namespace Claimstone {

ReplicatedKeyspace::ReplicatedKeyspace(int replication_factor, std::shared_ptr<Clock> clock,
		size_t shards_per_replica)
	: clock_(std::move(clock)) {
	if (replication_factor < 1) {
		throw std::invalid_argument("Replication factor must be at least 1");
	}
	if (!clock_) {
		throw std::invalid_argument("ReplicatedKeyspace needs a clock");
	}
	replicas_.reserve(replication_factor);
	for (int i = 0; i < replication_factor; ++i) {
		replicas_.push_back(std::make_unique<Replica>(i, shards_per_replica));
	}
	VLOG(1) << "Created keyspace with " << replication_factor << " replicas";
}

uint64_t ReplicatedKeyspace::NowMicros() {
	uint64_t now = clock_->NowMicros();
	absl::MutexLock lock(&timestamp_mutex_);
	// Two writes must never share a timestamp, or the later one could lose the
	// last-write-wins tie break.
	last_timestamp_us_ = std::max(now, last_timestamp_us_ + 1);
	return last_timestamp_us_;
}

int ReplicatedKeyspace::GetAvailableReplicaCount() const {
	return static_cast<int>(std::count_if(replicas_.begin(), replicas_.end(),
				[](const std::unique_ptr<Replica>& replica) { return replica->IsAvailable(); }));
}

void ReplicatedKeyspace::SetReplicaAvailable(int replica_id, bool available) {
	GetReplica(replica_id).SetAvailable(available);
	LOG(INFO) << "Replica " << replica_id << " marked " << (available ? "available" : "unavailable");
}

Replica& ReplicatedKeyspace::GetReplica(int replica_id) {
	if (replica_id < 0 || replica_id >= GetReplicationFactor()) {
		throw std::out_of_range(absl::StrCat("Replica id ", replica_id, " out of range (0-",
					GetReplicationFactor() - 1, ")"));
	}
	return *replicas_[replica_id];
}

std::vector<Replica*> ReplicatedKeyspace::selectReplicas(ConsistencyLevel level, const char* operation) {
	int required = RequiredReplicas(level, GetReplicationFactor());

	std::vector<Replica*> selected;
	for (auto& replica : replicas_) {
		if (replica->IsAvailable()) {
			selected.push_back(replica.get());
		}
	}
	if (static_cast<int>(selected.size()) < required) {
		LOG(WARNING) << operation << " at " << ConsistencyLevelName(level) << " needs " << required
			<< " replicas, only " << selected.size() << " available";
		throw StorageException(absl::StrCat("Not enough replicas available for ", operation, " at ",
					ConsistencyLevelName(level), ": required ", required, ", alive ", selected.size()));
	}
	return selected;
}

void ReplicatedKeyspace::ExecuteBatch(const MutationBatch& batch) {
	// Validate before touching any replica so a bad batch leaves no trace.
	for (const auto& row : batch.GetRowMutations()) {
		if (row.column_family.name.empty() || row.row_key.empty()) {
			throw StorageException("Mutation batch contains a row without column family or key");
		}
		for (const auto& column : row.columns) {
			if (column.name.empty()) {
				throw StorageException(absl::StrCat("Empty column name in row ", row.row_key));
			}
			if (column.ttl_seconds < 0) {
				throw StorageException(absl::StrCat("Negative TTL for column ", column.name));
			}
		}
	}

	uint64_t timestamp_us = batch.GetTimestamp().has_value() ? *batch.GetTimestamp() : NowMicros();

	absl::MutexLock lock(&batch_mutex_);
	// Writes go to every available replica, not just the acknowledging ones.
	std::vector<Replica*> targets = selectReplicas(batch.GetConsistencyLevel(), "write");

	size_t applied = 0;
	for (const auto& row : batch.GetRowMutations()) {
		for (const auto& mutation : row.columns) {
			Column column;
			column.name = mutation.name;
			column.value = mutation.value;
			column.timestamp_us = timestamp_us;
			column.ttl_seconds = mutation.is_delete ? 0 : mutation.ttl_seconds;
			column.deleted = mutation.is_delete;
			for (Replica* replica : targets) {
				replica->Apply(row.column_family, row.row_key, column);
			}
			applied++;
		}
	}
	VLOG(2) << "Applied batch of " << applied << " column mutations over " << batch.GetRowCount()
		<< " rows to " << targets.size() << " replicas at " << timestamp_us;
}

ColumnSlice ReplicatedKeyspace::ReadRow(const ColumnFamily& column_family,
		const std::string& row_key,
		const std::string& column_prefix,
		ConsistencyLevel level) {
	int required = RequiredReplicas(level, GetReplicationFactor());
	uint64_t now_us = clock_->NowMicros();

	absl::ReaderMutexLock lock(&batch_mutex_);
	std::vector<Replica*> contacted = selectReplicas(level, "read");
	contacted.resize(required);

	// Merge the contacted replicas, keeping the newest version of every column.
	absl::flat_hash_map<std::string, Column> newest;
	for (Replica* replica : contacted) {
		for (auto& column : replica->Slice(column_family, row_key, column_prefix)) {
			auto it = newest.find(column.name);
			if (it == newest.end()) {
				std::string name = column.name;
				newest.emplace(std::move(name), std::move(column));
			} else if (column.Supersedes(it->second)) {
				it->second = std::move(column);
			}
		}
	}

	ColumnSlice result;
	for (auto& [name, column] : newest) {
		if (column.IsLive(now_us)) {
			result.push_back(std::move(column));
		}
	}
	std::sort(result.begin(), result.end(),
			[](const Column& a, const Column& b) { return a.name < b.name; });
	return result;
}

size_t ReplicatedKeyspace::Compact(uint64_t gc_grace_us) {
	uint64_t now_us = clock_->NowMicros();
	absl::MutexLock lock(&batch_mutex_);
	size_t removed = 0;
	for (auto& replica : replicas_) {
		removed += replica->Compact(now_us, gc_grace_us);
	}
	return removed;
}

} // namespace Claimstone
