#include "replica.h"

#include <mutex>

#include <absl/hash/hash.h>
#include <absl/strings/match.h>
#include <glog/logging.h>

namespace Claimstone {

Replica::Replica(int id, size_t num_shards) : id_(id) {
	CHECK_GT(num_shards, 0u) << "Replica " << id << " needs at least one shard";
	shards_.reserve(num_shards);
	for (size_t i = 0; i < num_shards; ++i) {
		shards_.push_back(std::make_unique<Shard>());
	}
}

size_t Replica::getShardIndex(const RowId& row_id) const {
	return absl::Hash<RowId>{}(row_id) % shards_.size();
}

bool Replica::Apply(const ColumnFamily& column_family, const std::string& row_key, const Column& incoming) {
	RowId row_id(column_family.name, row_key);
	Shard& shard = *shards_[getShardIndex(row_id)];
	std::unique_lock<std::shared_mutex> lock(shard.mutex);

	Row& row = shard.rows[row_id];
	auto it = row.find(incoming.name);
	if (it == row.end()) {
		row.emplace(incoming.name, incoming);
		return true;
	}
	if (!incoming.Supersedes(it->second)) {
		VLOG(3) << "Replica " << id_ << " ignored older write to " << column_family.name
			<< "/" << row_key << ":" << incoming.name;
		return false;
	}
	it->second = incoming;
	return true;
}

ColumnSlice Replica::Slice(const ColumnFamily& column_family, const std::string& row_key,
		const std::string& column_prefix) const {
	RowId row_id(column_family.name, row_key);
	const Shard& shard = *shards_[getShardIndex(row_id)];
	std::shared_lock<std::shared_mutex> lock(shard.mutex);

	ColumnSlice slice;
	auto row_it = shard.rows.find(row_id);
	if (row_it == shard.rows.end()) {
		return slice;
	}
	const Row& row = row_it->second;
	for (auto it = row.lower_bound(column_prefix); it != row.end(); ++it) {
		if (!absl::StartsWith(it->first, column_prefix)) {
			break;
		}
		slice.push_back(it->second);
	}
	return slice;
}

size_t Replica::Compact(uint64_t now_us, uint64_t gc_grace_us) {
	size_t removed = 0;
	for (auto& shard : shards_) {
		std::unique_lock<std::shared_mutex> lock(shard->mutex);
		for (auto row_it = shard->rows.begin(); row_it != shard->rows.end();) {
			Row& row = row_it->second;
			for (auto it = row.begin(); it != row.end();) {
				const Column& column = it->second;
				bool drop = column.deleted
					? now_us >= column.timestamp_us + gc_grace_us
					: column.HasExpired(now_us);
				if (drop) {
					it = row.erase(it);
					removed++;
				} else {
					++it;
				}
			}
			if (row.empty()) {
				shard->rows.erase(row_it++);
			} else {
				++row_it;
			}
		}
	}
	VLOG(1) << "Replica " << id_ << " compaction removed " << removed << " columns";
	return removed;
}

size_t Replica::RowCount() const {
	size_t total = 0;
	for (const auto& shard : shards_) {
		std::shared_lock<std::shared_mutex> lock(shard->mutex);
		total += shard->rows.size();
	}
	return total;
}

void Replica::Clear() {
	for (auto& shard : shards_) {
		std::unique_lock<std::shared_mutex> lock(shard->mutex);
		shard->rows.clear();
	}
}

} // namespace Claimstone
