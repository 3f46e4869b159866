#ifndef CLAIMSTONE_SRC_STORAGE_REPLICA_H_
#define CLAIMSTONE_SRC_STORAGE_REPLICA_H_

#include <atomic>
#include <memory>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

#include <absl/container/btree_map.h>
#include <absl/container/flat_hash_map.h>

#include "column.h"

namespace Claimstone {

/**
 * One replica's copy of the column data. Rows are spread over shards, each
 * guarded by its own shared mutex. Writes resolve per column with
 * last-write-wins on the write timestamp.
 */
class Replica {
	private:
		// Columns of one row, ordered by name for prefix slices
		using Row = absl::btree_map<std::string, Column>;
		using RowId = std::pair<std::string, std::string>;  // (column family, row key)

		struct Shard {
			absl::flat_hash_map<RowId, Row> rows;
			mutable std::shared_mutex mutex;

			Shard() = default;

			// Prevent copying and moving
			Shard(const Shard&) = delete;
			Shard& operator=(const Shard&) = delete;
		};

		const int id_;
		std::vector<std::unique_ptr<Shard>> shards_;
		std::atomic<bool> available_{true};

		size_t getShardIndex(const RowId& row_id) const;

	public:
		Replica(int id, size_t num_shards);

		// Prevent copying and moving
		Replica(const Replica&) = delete;
		Replica& operator=(const Replica&) = delete;

		int id() const { return id_; }

		bool IsAvailable() const { return available_.load(std::memory_order_acquire); }
		void SetAvailable(bool available) { available_.store(available, std::memory_order_release); }

		// Applies |incoming| unless the stored version supersedes it.
		// Returns true if the stored column changed.
		bool Apply(const ColumnFamily& column_family, const std::string& row_key, const Column& incoming);

		// Every stored version (tombstones and expired columns included) whose
		// name starts with |column_prefix|.
		ColumnSlice Slice(const ColumnFamily& column_family, const std::string& row_key,
				const std::string& column_prefix) const;

		// Drops expired columns, and tombstones older than |gc_grace_us|.
		// Returns the number of columns removed.
		size_t Compact(uint64_t now_us, uint64_t gc_grace_us);

		size_t RowCount() const;

		void Clear();
};

} // namespace Claimstone

#endif // CLAIMSTONE_SRC_STORAGE_REPLICA_H_
