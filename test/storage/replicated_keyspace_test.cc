#include <gtest/gtest.h>
#include "../../src/common/exceptions.h"
#include "../../src/storage/replicated_keyspace.h"

#include <memory>
#include <stdexcept>

using namespace Claimstone;

TEST(ConsistencyLevelTest, RequiredReplicasPerLevel) {
    EXPECT_EQ(RequiredReplicas(ConsistencyLevel::ANY, 3), 1);
    EXPECT_EQ(RequiredReplicas(ConsistencyLevel::ONE, 3), 1);
    EXPECT_EQ(RequiredReplicas(ConsistencyLevel::LOCAL_ONE, 3), 1);
    EXPECT_EQ(RequiredReplicas(ConsistencyLevel::TWO, 3), 2);
    EXPECT_EQ(RequiredReplicas(ConsistencyLevel::THREE, 3), 3);
    EXPECT_EQ(RequiredReplicas(ConsistencyLevel::QUORUM, 3), 2);
    EXPECT_EQ(RequiredReplicas(ConsistencyLevel::LOCAL_QUORUM, 5), 3);
    EXPECT_EQ(RequiredReplicas(ConsistencyLevel::EACH_QUORUM, 4), 3);
    EXPECT_EQ(RequiredReplicas(ConsistencyLevel::ALL, 5), 5);
}

TEST(ConsistencyLevelTest, UnsatisfiableLevelThrows) {
    EXPECT_THROW(RequiredReplicas(ConsistencyLevel::THREE, 2), StorageException);
    EXPECT_THROW(RequiredReplicas(ConsistencyLevel::ONE, 0), StorageException);
}

TEST(ConsistencyLevelTest, ParsesNames) {
    EXPECT_EQ(parseConsistencyLevel("LOCAL_QUORUM"), ConsistencyLevel::LOCAL_QUORUM);
    EXPECT_EQ(parseConsistencyLevel("cl_local_quorum"), ConsistencyLevel::LOCAL_QUORUM);
    EXPECT_EQ(parseConsistencyLevel("all"), ConsistencyLevel::ALL);
    EXPECT_EQ(ConsistencyLevelName(ConsistencyLevel::EACH_QUORUM), "EACH_QUORUM");
    EXPECT_THROW(parseConsistencyLevel("MOST"), std::invalid_argument);
}

class ReplicatedKeyspaceTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<ManualClock>();
        keyspace_ = std::make_unique<ReplicatedKeyspace>(3, clock_, 4);
    }

    void Write(const std::string& row, const std::string& column, const std::string& value,
               ConsistencyLevel level, std::optional<int> ttl = std::nullopt) {
        MutationBatch batch = keyspace_->PrepareMutationBatch();
        batch.SetConsistencyLevel(level);
        batch.WithRow(users_, row).PutColumn(column, value, ttl);
        batch.Execute();
    }

    ColumnSlice Read(const std::string& row, ConsistencyLevel level,
                     const std::string& prefix = "") {
        return keyspace_->ReadRow(users_, row, prefix, level);
    }

    const ColumnFamily users_{"users"};
    std::shared_ptr<ManualClock> clock_;
    std::unique_ptr<ReplicatedKeyspace> keyspace_;
};

TEST_F(ReplicatedKeyspaceTest, ConstructorRejectsBadArguments) {
    EXPECT_THROW(ReplicatedKeyspace(0, clock_), std::invalid_argument);
    EXPECT_THROW(ReplicatedKeyspace(3, nullptr), std::invalid_argument);
}

TEST_F(ReplicatedKeyspaceTest, BatchReachesEveryAvailableReplica) {
    Write("alice", "email", "a@example", ConsistencyLevel::ONE);

    for (int i = 0; i < 3; ++i) {
        auto slice = keyspace_->GetReplica(i).Slice(users_, "alice", "");
        ASSERT_EQ(slice.size(), 1u) << "replica " << i;
        EXPECT_EQ(slice[0].value, "a@example");
    }
}

TEST_F(ReplicatedKeyspaceTest, MultiRowBatchSharesTimestamp) {
    MutationBatch batch = keyspace_->PrepareMutationBatch();
    batch.WithRow(users_, "alice").PutColumn("email", "a@example");
    batch.WithRow(users_, "bob").PutColumn("email", "b@example");
    batch.WithRow(users_, "alice").PutColumn("name", "Alice");
    EXPECT_EQ(batch.GetRowCount(), 2u);
    batch.Execute();

    auto alice = Read("alice", ConsistencyLevel::ALL);
    auto bob = Read("bob", ConsistencyLevel::ALL);
    ASSERT_EQ(alice.size(), 2u);
    ASSERT_EQ(bob.size(), 1u);
    EXPECT_EQ(alice[0].name, "email");
    EXPECT_EQ(alice[1].name, "name");
    EXPECT_EQ(alice[0].timestamp_us, bob[0].timestamp_us);
    EXPECT_EQ(alice[1].timestamp_us, bob[0].timestamp_us);
}

TEST_F(ReplicatedKeyspaceTest, WriteFailsWithoutEnoughReplicasAndLeavesNoTrace) {
    keyspace_->SetReplicaAvailable(0, false);
    keyspace_->SetReplicaAvailable(1, false);
    EXPECT_EQ(keyspace_->GetAvailableReplicaCount(), 1);

    EXPECT_THROW(Write("alice", "email", "a@example", ConsistencyLevel::QUORUM), StorageException);

    keyspace_->SetReplicaAvailable(0, true);
    keyspace_->SetReplicaAvailable(1, true);
    EXPECT_TRUE(Read("alice", ConsistencyLevel::ALL).empty());
}

TEST_F(ReplicatedKeyspaceTest, ReadFailsWithoutEnoughReplicas) {
    keyspace_->SetReplicaAvailable(2, false);
    EXPECT_NO_THROW(Read("alice", ConsistencyLevel::LOCAL_QUORUM));
    EXPECT_THROW(Read("alice", ConsistencyLevel::ALL), StorageException);
}

TEST_F(ReplicatedKeyspaceTest, QuorumReadSeesQuorumWrite) {
    // Replica 2 misses the write
    keyspace_->SetReplicaAvailable(2, false);
    Write("alice", "email", "a@example", ConsistencyLevel::QUORUM);

    // Replica 0 goes away; the quorum of 1 and 2 still overlaps the write
    keyspace_->SetReplicaAvailable(2, true);
    keyspace_->SetReplicaAvailable(0, false);
    auto slice = Read("alice", ConsistencyLevel::QUORUM);
    ASSERT_EQ(slice.size(), 1u);
    EXPECT_EQ(slice[0].value, "a@example");
}

TEST_F(ReplicatedKeyspaceTest, WeakReadCanMissWeakWrite) {
    keyspace_->SetReplicaAvailable(0, false);
    Write("alice", "email", "a@example", ConsistencyLevel::ONE);
    keyspace_->SetReplicaAvailable(0, true);

    // ONE contacts replica 0 only, which never saw the write
    EXPECT_TRUE(Read("alice", ConsistencyLevel::ONE).empty());
    EXPECT_EQ(Read("alice", ConsistencyLevel::TWO).size(), 1u);
}

TEST_F(ReplicatedKeyspaceTest, ReadMergesNewestVersionAcrossReplicas) {
    Write("alice", "email", "a@old", ConsistencyLevel::ALL);
    keyspace_->SetReplicaAvailable(0, false);
    Write("alice", "email", "a@new", ConsistencyLevel::QUORUM);
    keyspace_->SetReplicaAvailable(0, true);

    auto slice = Read("alice", ConsistencyLevel::QUORUM);
    ASSERT_EQ(slice.size(), 1u);
    EXPECT_EQ(slice[0].value, "a@new");
}

TEST_F(ReplicatedKeyspaceTest, DeleteHidesColumn) {
    Write("alice", "email", "a@example", ConsistencyLevel::ALL);

    MutationBatch batch = keyspace_->PrepareMutationBatch();
    batch.WithRow(users_, "alice").DeleteColumn("email");
    batch.Execute();

    EXPECT_TRUE(Read("alice", ConsistencyLevel::ALL).empty());
}

TEST_F(ReplicatedKeyspaceTest, ReadFiltersByPrefix) {
    Write("alice", "_LOCK_abc", "0", ConsistencyLevel::ALL);
    Write("alice", "email", "a@example", ConsistencyLevel::ALL);

    auto slice = Read("alice", ConsistencyLevel::ALL, "_LOCK_");
    ASSERT_EQ(slice.size(), 1u);
    EXPECT_EQ(slice[0].name, "_LOCK_abc");
}

TEST_F(ReplicatedKeyspaceTest, TtlColumnDisappears) {
    Write("alice", "_LOCK_abc", "1", ConsistencyLevel::ALL, 30);
    EXPECT_EQ(Read("alice", ConsistencyLevel::ALL).size(), 1u);

    clock_->AdvanceSeconds(29);
    EXPECT_EQ(Read("alice", ConsistencyLevel::ALL).size(), 1u);

    clock_->AdvanceSeconds(2);
    EXPECT_TRUE(Read("alice", ConsistencyLevel::ALL).empty());
}

TEST_F(ReplicatedKeyspaceTest, NowMicrosIsStrictlyIncreasing) {
    // The manual clock does not move, the keyspace still hands out distinct stamps
    uint64_t first = keyspace_->NowMicros();
    uint64_t second = keyspace_->NowMicros();
    EXPECT_GE(first, clock_->NowMicros());
    EXPECT_GT(second, first);
}

TEST_F(ReplicatedKeyspaceTest, LaterBatchWinsOverEarlierOnSameClockTick) {
    Write("alice", "_LOCK_abc", "12345", ConsistencyLevel::ALL, 30);
    Write("alice", "_LOCK_abc", "0", ConsistencyLevel::ALL);

    clock_->AdvanceSeconds(60);
    auto slice = Read("alice", ConsistencyLevel::ALL);
    ASSERT_EQ(slice.size(), 1u);
    EXPECT_EQ(slice[0].value, "0");
    EXPECT_EQ(slice[0].ttl_seconds, 0);
}

TEST_F(ReplicatedKeyspaceTest, ExplicitTimestampIsUsed) {
    uint64_t timestamp = clock_->NowMicros() + 5;
    MutationBatch batch = keyspace_->PrepareMutationBatch();
    batch.SetTimestamp(timestamp).WithRow(users_, "alice").PutColumn("email", "a@example");
    batch.Execute();

    auto slice = Read("alice", ConsistencyLevel::ALL);
    ASSERT_EQ(slice.size(), 1u);
    EXPECT_EQ(slice[0].timestamp_us, timestamp);
}

TEST_F(ReplicatedKeyspaceTest, InvalidBatchIsRejectedBeforeAnyWrite) {
    MutationBatch batch = keyspace_->PrepareMutationBatch();
    batch.WithRow(users_, "alice").PutColumn("email", "a@example");
    batch.WithRow(users_, "bob").PutColumn("", "nameless");
    EXPECT_THROW(batch.Execute(), StorageException);
    EXPECT_TRUE(Read("alice", ConsistencyLevel::ALL).empty());

    MutationBatch negative_ttl = keyspace_->PrepareMutationBatch();
    negative_ttl.WithRow(users_, "alice").PutColumn("email", "a@example", -1);
    EXPECT_THROW(negative_ttl.Execute(), StorageException);
}

TEST_F(ReplicatedKeyspaceTest, EmptyBatchIsANoOp) {
    for (int i = 0; i < 3; ++i) {
        keyspace_->SetReplicaAvailable(i, false);
    }
    MutationBatch batch = keyspace_->PrepareMutationBatch();
    EXPECT_TRUE(batch.IsEmpty());
    EXPECT_NO_THROW(batch.Execute());
}

TEST_F(ReplicatedKeyspaceTest, MergeShallowCombinesRows) {
    MutationBatch first = keyspace_->PrepareMutationBatch();
    first.WithRow(users_, "alice").PutColumn("email", "a@example");

    MutationBatch second = keyspace_->PrepareMutationBatch();
    second.WithRow(users_, "alice").PutColumn("name", "Alice");
    second.WithRow(users_, "bob").PutColumn("email", "b@example");

    first.MergeShallow(second);
    EXPECT_EQ(first.GetRowCount(), 2u);
    first.Execute();

    EXPECT_EQ(Read("alice", ConsistencyLevel::ALL).size(), 2u);
    EXPECT_EQ(Read("bob", ConsistencyLevel::ALL).size(), 1u);
}

TEST_F(ReplicatedKeyspaceTest, DiscardEmptiesBatch) {
    MutationBatch batch = keyspace_->PrepareMutationBatch();
    batch.WithRow(users_, "alice").PutColumn("email", "a@example");
    batch.Discard();
    EXPECT_TRUE(batch.IsEmpty());
    batch.Execute();
    EXPECT_TRUE(Read("alice", ConsistencyLevel::ALL).empty());
}

TEST_F(ReplicatedKeyspaceTest, CompactRemovesExpiredColumnsFromEveryReplica) {
    Write("alice", "_LOCK_abc", "1", ConsistencyLevel::ALL, 10);
    Write("alice", "email", "a@example", ConsistencyLevel::ALL);
    clock_->AdvanceSeconds(11);

    EXPECT_EQ(keyspace_->Compact(0), 3u);
    for (int i = 0; i < 3; ++i) {
        EXPECT_EQ(keyspace_->GetReplica(i).Slice(users_, "alice", "").size(), 1u);
    }
}

TEST_F(ReplicatedKeyspaceTest, UnknownReplicaThrows) {
    EXPECT_THROW(keyspace_->GetReplica(3), std::out_of_range);
    EXPECT_THROW(keyspace_->SetReplicaAvailable(-1, false), std::out_of_range);
}
