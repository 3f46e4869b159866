#ifndef CLAIMSTONE_SRC_STORAGE_REPLICATED_KEYSPACE_H_
#define CLAIMSTONE_SRC_STORAGE_REPLICATED_KEYSPACE_H_

#include <memory>
#include <string>
#include <vector>

#include "absl/synchronization/mutex.h"

#include "clock.h"
#include "keyspace.h"
#include "replica.h"

namespace Claimstone {

/**
 * In-process keyspace replicated over |replication_factor| replicas.
 *
 * A batch is applied to every available replica under one exclusive lock, so
 * readers see all of it or none of it. Replicas marked unavailable miss the
 * write; reads merge the first N available replicas (N from the consistency
 * level) column by column, latest timestamp wins.
 */
class ReplicatedKeyspace : public Keyspace {
	public:
		ReplicatedKeyspace(int replication_factor, std::shared_ptr<Clock> clock,
				size_t shards_per_replica = 64);

		~ReplicatedKeyspace() override = default;

		ReplicatedKeyspace(const ReplicatedKeyspace&) = delete;
		ReplicatedKeyspace& operator=(const ReplicatedKeyspace&) = delete;

		void ExecuteBatch(const MutationBatch& batch) override;

		ColumnSlice ReadRow(const ColumnFamily& column_family,
				const std::string& row_key,
				const std::string& column_prefix,
				ConsistencyLevel level) override;

		uint64_t NowMicros() override;

		int GetReplicationFactor() const { return static_cast<int>(replicas_.size()); }
		int GetAvailableReplicaCount() const;

		// Failure drills: an unavailable replica neither acknowledges nor serves.
		void SetReplicaAvailable(int replica_id, bool available);

		Replica& GetReplica(int replica_id);

		// Runs Replica::Compact on every replica. Returns the columns removed.
		size_t Compact(uint64_t gc_grace_us);

		Clock& clock() { return *clock_; }

	private:
		// Available replicas in id order; throws if fewer than |level| needs.
		std::vector<Replica*> selectReplicas(ConsistencyLevel level, const char* operation);

		std::shared_ptr<Clock> clock_;
		std::vector<std::unique_ptr<Replica>> replicas_;

		absl::Mutex batch_mutex_;

		absl::Mutex timestamp_mutex_;
		uint64_t last_timestamp_us_ ABSL_GUARDED_BY(timestamp_mutex_) = 0;
};

} // namespace Claimstone

#endif // CLAIMSTONE_SRC_STORAGE_REPLICATED_KEYSPACE_H_
