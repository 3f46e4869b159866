#include "mutation_batch.h"

#include <glog/logging.h>

#include "keyspace.h"

namespace Claimstone {

RowMutation& RowMutation::PutColumn(const std::string& name, const std::string& value,
		std::optional<int> ttl_seconds) {
	ColumnMutation mutation;
	mutation.name = name;
	mutation.value = value;
	mutation.ttl_seconds = ttl_seconds.value_or(0);
	columns.push_back(std::move(mutation));
	return *this;
}

RowMutation& RowMutation::DeleteColumn(const std::string& name) {
	ColumnMutation mutation;
	mutation.name = name;
	mutation.is_delete = true;
	columns.push_back(std::move(mutation));
	return *this;
}

MutationBatch::MutationBatch(Keyspace* keyspace) : keyspace_(keyspace) {}

RowMutation& MutationBatch::WithRow(const ColumnFamily& column_family, const std::string& row_key) {
	auto [it, inserted] = row_index_.try_emplace(std::make_pair(column_family.name, row_key), rows_.size());
	if (inserted) {
		RowMutation row;
		row.column_family = column_family;
		row.row_key = row_key;
		rows_.push_back(std::move(row));
	}
	return rows_[it->second];
}

MutationBatch& MutationBatch::MergeShallow(const MutationBatch& other) {
	for (const auto& row : other.rows_) {
		RowMutation& target = WithRow(row.column_family, row.row_key);
		target.columns.insert(target.columns.end(), row.columns.begin(), row.columns.end());
	}
	return *this;
}

bool MutationBatch::IsEmpty() const {
	for (const auto& row : rows_) {
		if (!row.columns.empty()) {
			return false;
		}
	}
	return true;
}

void MutationBatch::Discard() {
	rows_.clear();
	row_index_.clear();
}

void MutationBatch::Execute() {
	if (IsEmpty()) {
		VLOG(3) << "Skipping execution of empty mutation batch";
		return;
	}
	keyspace_->ExecuteBatch(*this);
}

} // namespace Claimstone
