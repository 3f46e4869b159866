#include <gtest/gtest.h>
#include "../../src/uniqueness/probe_token.h"

#include <mutex>
#include <set>
#include <thread>
#include <vector>

using namespace Claimstone;

TEST(ProbeTokenTest, HasTimeUuidLayout) {
    std::string token = GenerateProbeToken();
    ASSERT_EQ(token.size(), 36u);
    EXPECT_EQ(token[8], '-');
    EXPECT_EQ(token[13], '-');
    EXPECT_EQ(token[18], '-');
    EXPECT_EQ(token[23], '-');
    // Version 1, RFC 4122 variant
    EXPECT_EQ(token[14], '1');
    EXPECT_NE(std::string("89ab").find(token[19]), std::string::npos);
}

TEST(ProbeTokenTest, TimestampRoundTrips) {
    const uint64_t micros = 1'700'000'000'123'456ULL;
    std::string token = ProbeTokenForMicros(micros);
    auto recovered = ProbeTokenTimestampMicros(token);
    ASSERT_TRUE(recovered.has_value());
    EXPECT_EQ(*recovered, micros);
}

TEST(ProbeTokenTest, GeneratedTokenCarriesCurrentTime) {
    uint64_t before = UniqueTimeMicros();
    std::string token = GenerateProbeToken();
    uint64_t after = UniqueTimeMicros();

    auto micros = ProbeTokenTimestampMicros(token);
    ASSERT_TRUE(micros.has_value());
    EXPECT_GT(*micros, before);
    EXPECT_LT(*micros, after);
}

TEST(ProbeTokenTest, RejectsOtherStrings) {
    EXPECT_FALSE(ProbeTokenTimestampMicros("").has_value());
    EXPECT_FALSE(ProbeTokenTimestampMicros("custom-token").has_value());
    // Version 4 UUID
    EXPECT_FALSE(ProbeTokenTimestampMicros("3f2b8c1e-9d4a-4b6e-8f1a-2c3d4e5f6a7b").has_value());
    EXPECT_FALSE(ProbeTokenTimestampMicros("zzzzzzzz-zzzz-1zzz-8zzz-zzzzzzzzzzzz").has_value());
}

TEST(ProbeTokenTest, UniqueTimeIsStrictlyIncreasing) {
    uint64_t previous = UniqueTimeMicros();
    for (int i = 0; i < 10000; ++i) {
        uint64_t next = UniqueTimeMicros();
        ASSERT_GT(next, previous);
        previous = next;
    }
}

TEST(ProbeTokenTest, TokensAreDistinctAcrossThreads) {
    const int num_threads = 4;
    const int tokens_per_thread = 2500;
    std::set<std::string> tokens;
    std::mutex mutex;
    std::vector<std::thread> threads;

    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([&]() {
            std::vector<std::string> local;
            local.reserve(tokens_per_thread);
            for (int i = 0; i < tokens_per_thread; ++i) {
                local.push_back(GenerateProbeToken());
            }
            std::lock_guard<std::mutex> lock(mutex);
            tokens.insert(local.begin(), local.end());
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(tokens.size(), static_cast<size_t>(num_threads * tokens_per_thread));
}
