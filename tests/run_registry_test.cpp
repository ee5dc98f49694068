#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>

#include "bus/event_channel.hpp"
#include "policy/execution_policy.hpp"
#include "run/run_registry.hpp"
#include "sandbox/sandbox_runtime.hpp"
#include "test_support.hpp"

namespace scriptbox::run {
namespace {

std::shared_ptr<sandbox::ProcessSupervisor> MakeIdleSupervisor(boost::asio::io_context& io,
                                                               bus::EventChannel& channel,
                                                               const sandbox::SandboxRuntime& runtime,
                                                               const std::string& run_id) {
    sandbox::RunSession session{};
    session.run_id = run_id;
    session.file_name = "idle.sh";
    return std::make_shared<sandbox::ProcessSupervisor>(
        io, channel, runtime, std::move(session), policy::Resolve("idle.sh"));
}

TEST(RunRegistryTest, GeneratedIdsAreUuids) {
    const auto id = GenerateRunId();
    EXPECT_EQ(id.size(), 36u);
    EXPECT_NE(id, GenerateRunId());
}

TEST(RunRegistryTest, ReserveSkipsIdsAlreadyInUse) {
    std::vector<std::string> sequence = {"a", "a", "", "b"};
    std::size_t next = 0;
    RunRegistry registry([&sequence, &next]() { return sequence[next++ % sequence.size()]; });

    EXPECT_EQ(registry.Reserve(), "a");
    EXPECT_EQ(registry.Reserve(), "b");
    EXPECT_EQ(registry.Size(), 2u);
}

TEST(RunRegistryTest, ReservedIdHasNoSupervisorUntilAttached) {
    boost::asio::io_context io;
    bus::EventChannel channel;
    sandbox::LocalRuntime runtime;
    RunRegistry registry;

    const auto run_id = registry.Reserve();
    EXPECT_TRUE(registry.Contains(run_id));
    EXPECT_EQ(registry.Find(run_id), nullptr);
    EXPECT_FALSE(registry.IsActive(run_id));

    auto supervisor = MakeIdleSupervisor(io, channel, runtime, run_id);
    EXPECT_TRUE(registry.Attach(run_id, supervisor));
    EXPECT_EQ(registry.Find(run_id), supervisor);
    EXPECT_TRUE(registry.IsActive(run_id));
    EXPECT_FALSE(registry.Attach(run_id, supervisor));
    EXPECT_FALSE(registry.Attach("unknown", supervisor));
    EXPECT_EQ(registry.Snapshot().size(), 1u);
}

TEST(RunRegistryTest, TerminalRunIsNoLongerActive) {
    testing::TempDir dir("scriptbox_registry");
    dir.Write("done.sh", "true\n");
    boost::asio::io_context io;
    auto work = boost::asio::make_work_guard(io);
    std::thread worker([&io]() { io.run(); });
    bus::EventChannel channel;
    sandbox::LocalRuntime runtime;
    RunRegistry registry;

    const auto run_id = registry.Reserve();
    channel.Open(run_id);
    sandbox::RunSession session{};
    session.run_id = run_id;
    session.file_name = "done.sh";
    session.file_path = dir.Path() / "done.sh";
    auto supervisor = std::make_shared<sandbox::ProcessSupervisor>(
        io, channel, runtime, std::move(session), policy::Resolve("done.sh"));
    ASSERT_TRUE(registry.Attach(run_id, supervisor));
    EXPECT_EQ(registry.FindActive(run_id), supervisor);

    supervisor->Start();
    const auto until = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (!supervisor->IsTerminal() && std::chrono::steady_clock::now() < until) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    ASSERT_TRUE(supervisor->IsTerminal());

    // Still registered until cleanup removes it, but no longer active.
    EXPECT_TRUE(registry.Contains(run_id));
    EXPECT_EQ(registry.Find(run_id), supervisor);
    EXPECT_EQ(registry.FindActive(run_id), nullptr);
    EXPECT_FALSE(registry.IsActive(run_id));

    work.reset();
    worker.join();
}

TEST(RunRegistryTest, RemoveForgetsTheRun) {
    RunRegistry registry;
    const auto run_id = registry.Reserve();
    EXPECT_TRUE(registry.Remove(run_id));
    EXPECT_FALSE(registry.Remove(run_id));
    EXPECT_FALSE(registry.Contains(run_id));
    EXPECT_EQ(registry.Find(run_id), nullptr);
    EXPECT_EQ(registry.Size(), 0u);
}

TEST(RunRegistryTest, ConcurrentReserveAndRemoveStayConsistent) {
    constexpr int kThreads = 8;
    constexpr int kPerThread = 500;
    RunRegistry registry;
    std::mutex ids_mutex;
    std::set<std::string> ids;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&registry, &ids_mutex, &ids, t]() {
            std::vector<std::string> mine;
            for (int i = 0; i < kPerThread; ++i) {
                mine.push_back(registry.Reserve());
            }
            // Half of the threads give their runs back straight away.
            if (t % 2 == 0) {
                for (const auto& id : mine) {
                    EXPECT_TRUE(registry.Remove(id));
                }
                return;
            }
            std::lock_guard<std::mutex> lock(ids_mutex);
            ids.insert(mine.begin(), mine.end());
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(ids.size(), static_cast<std::size_t>(kThreads / 2 * kPerThread));
    EXPECT_EQ(registry.Size(), ids.size());
    for (const auto& id : ids) {
        EXPECT_TRUE(registry.Contains(id));
    }
}

}  // namespace
}  // namespace scriptbox::run
