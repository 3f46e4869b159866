#ifndef CLAIMSTONE_SRC_STORAGE_KEYSPACE_H_
#define CLAIMSTONE_SRC_STORAGE_KEYSPACE_H_

#include <cstdint>
#include <string>

#include "column.h"
#include "consistency_level.h"
#include "mutation_batch.h"

namespace Claimstone {

/**
 * Storage client boundary: produces and executes atomic multi-row batches
 * and reads column slices at a requested consistency level. Failures are
 * reported as StorageException.
 */
class Keyspace {
public:
	virtual ~Keyspace() = default;

	MutationBatch PrepareMutationBatch() { return MutationBatch(this); }

	virtual void ExecuteBatch(const MutationBatch& batch) = 0;

	// Live columns of the row whose names start with |column_prefix|, in name order.
	virtual ColumnSlice ReadRow(const ColumnFamily& column_family,
			const std::string& row_key,
			const std::string& column_prefix,
			ConsistencyLevel level) = 0;

	// Write timestamp source. Successive calls return strictly increasing values.
	virtual uint64_t NowMicros() = 0;
};

} // namespace Claimstone

#endif // CLAIMSTONE_SRC_STORAGE_KEYSPACE_H_
