#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

#include "server/stream_gate.hpp"

namespace scriptbox::server {
namespace {

TEST(StreamGateTest, CapsStreamsPerRun) {
    StreamGate gate(10, 2);
    EXPECT_TRUE(gate.TryAcquire("run-a"));
    EXPECT_TRUE(gate.TryAcquire("run-a"));
    EXPECT_FALSE(gate.TryAcquire("run-a"));
    EXPECT_TRUE(gate.TryAcquire("run-b"));
    EXPECT_EQ(gate.OpenFor("run-a"), 2u);
    EXPECT_EQ(gate.Open(), 3u);

    gate.Release("run-a");
    EXPECT_TRUE(gate.TryAcquire("run-a"));
}

TEST(StreamGateTest, CapsStreamsAcrossRuns) {
    StreamGate gate(3, 8);
    EXPECT_TRUE(gate.TryAcquire("run-a"));
    EXPECT_TRUE(gate.TryAcquire("run-b"));
    EXPECT_TRUE(gate.TryAcquire("run-c"));
    EXPECT_FALSE(gate.TryAcquire("run-d"));
    EXPECT_EQ(gate.OpenFor("run-d"), 0u);

    gate.Release("run-b");
    EXPECT_EQ(gate.OpenFor("run-b"), 0u);
    EXPECT_TRUE(gate.TryAcquire("run-d"));
    EXPECT_EQ(gate.Open(), 3u);
}

TEST(StreamGateTest, ReleaseOfUnknownRunIsIgnored) {
    StreamGate gate(1, 1);
    gate.Release("never-opened");
    EXPECT_EQ(gate.Open(), 0u);
    EXPECT_TRUE(gate.TryAcquire("run-a"));
}

TEST(StreamGateTest, ConcurrentViewersNeverExceedLimits) {
    constexpr int kThreads = 16;
    StreamGate gate(5, 3);
    std::atomic<int> admitted{0};
    std::atomic<bool> over_limit{false};

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&gate, &admitted, &over_limit, t]() {
            const std::string run_id = t % 2 == 0 ? "run-a" : "run-b";
            for (int i = 0; i < 200; ++i) {
                if (!gate.TryAcquire(run_id)) {
                    continue;
                }
                ++admitted;
                if (gate.Open() > 5 || gate.OpenFor(run_id) > 3) {
                    over_limit.store(true);
                }
                gate.Release(run_id);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_FALSE(over_limit.load());
    EXPECT_GT(admitted.load(), 0);
    EXPECT_EQ(gate.Open(), 0u);
}

}  // namespace
}  // namespace scriptbox::server
