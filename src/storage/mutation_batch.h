#ifndef CLAIMSTONE_SRC_STORAGE_MUTATION_BATCH_H_
#define CLAIMSTONE_SRC_STORAGE_MUTATION_BATCH_H_

#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <utility>

#include <absl/container/flat_hash_map.h>

#include "column.h"
#include "consistency_level.h"

namespace Claimstone {

class Keyspace;

struct ColumnMutation {
	std::string name;
	std::string value;
	int ttl_seconds = 0;
	bool is_delete = false;
};

// All column changes a batch makes to one row.
struct RowMutation {
	ColumnFamily column_family;
	std::string row_key;
	std::vector<ColumnMutation> columns;

	RowMutation& PutColumn(const std::string& name, const std::string& value,
			std::optional<int> ttl_seconds = std::nullopt);
	RowMutation& DeleteColumn(const std::string& name);
};

/**
 * Multi-row write applied atomically by the keyspace that prepared it.
 * Rows keep the order in which they were first touched. References returned
 * by WithRow() stay valid for the lifetime of the batch.
 */
class MutationBatch {
	public:
		explicit MutationBatch(Keyspace* keyspace);

		MutationBatch(MutationBatch&&) = default;
		MutationBatch& operator=(MutationBatch&&) = default;
		MutationBatch(const MutationBatch&) = delete;
		MutationBatch& operator=(const MutationBatch&) = delete;

		MutationBatch& SetConsistencyLevel(ConsistencyLevel level) {
			consistency_level_ = level;
			return *this;
		}
		ConsistencyLevel GetConsistencyLevel() const { return consistency_level_; }

		// Write timestamp for every column in the batch. When unset the keyspace
		// assigns one at execution time.
		MutationBatch& SetTimestamp(uint64_t timestamp_us) {
			timestamp_us_ = timestamp_us;
			return *this;
		}
		std::optional<uint64_t> GetTimestamp() const { return timestamp_us_; }

		RowMutation& WithRow(const ColumnFamily& column_family, const std::string& row_key);

		// Appends the row mutations of |other|. Columns of a row present in both
		// batches are concatenated; consistency level and timestamp stay ours.
		MutationBatch& MergeShallow(const MutationBatch& other);

		bool IsEmpty() const;
		size_t GetRowCount() const { return rows_.size(); }
		const std::deque<RowMutation>& GetRowMutations() const { return rows_; }

		void Discard();

		// Throws StorageException if the keyspace cannot apply the batch.
		void Execute();

	private:
		Keyspace* keyspace_;
		ConsistencyLevel consistency_level_ = ConsistencyLevel::LOCAL_QUORUM;
		std::optional<uint64_t> timestamp_us_;
		std::deque<RowMutation> rows_;
		absl::flat_hash_map<std::pair<std::string, std::string>, size_t> row_index_;
};

} // namespace Claimstone

#endif // CLAIMSTONE_SRC_STORAGE_MUTATION_BATCH_H_
