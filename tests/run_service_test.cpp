#include <gtest/gtest.h>

#include <chrono>
#include <set>
#include <thread>
#include <vector>

#include "run/run_service.hpp"
#include "test_support.hpp"

namespace scriptbox::run {
namespace {

using namespace std::chrono_literals;

class RunServiceTest : public ::testing::Test {
protected:
    RunServiceTest()
        : dir_("scriptbox_service")
        , store_(dir_.Path())
        , service_(MakeConfig(), store_, std::make_unique<sandbox::LocalRuntime>()) {}

    static config::RunsConfig MakeConfig() {
        config::RunsConfig config{};
        config.workers = 2;
        config.drain_grace_ms = 300;
        config.kill_grace_ms = 1000;
        return config;
    }

    bool WaitForIdle(std::chrono::milliseconds timeout = 5s) {
        const auto until = std::chrono::steady_clock::now() + timeout;
        while (service_.ActiveRuns() > 0) {
            if (std::chrono::steady_clock::now() > until) {
                return false;
            }
            std::this_thread::sleep_for(10ms);
        }
        return true;
    }

    testing::TempDir dir_;
    storage::DirectoryBlobStore store_;
    RunService service_;
};

TEST_F(RunServiceTest, RejectsTraversalWithoutCreatingARun) {
    const auto result = service_.Submit(RunRequest{"../etc/passwd", 10}, true);
    EXPECT_EQ(result.status, SubmitStatus::kInvalidFileName);
    EXPECT_TRUE(result.run_id.empty());
    EXPECT_EQ(result.subscription, nullptr);
    EXPECT_EQ(service_.ActiveRuns(), 0u);
}

TEST_F(RunServiceTest, RejectsMissingFile) {
    const auto result = service_.Submit(RunRequest{"absent.py", 10});
    EXPECT_EQ(result.status, SubmitStatus::kNotFound);
    EXPECT_TRUE(result.run_id.empty());
    EXPECT_EQ(service_.ActiveRuns(), 0u);
}

TEST_F(RunServiceTest, RunsScriptAndCleansUp) {
    dir_.Write("hello.sh", "echo hi\n");
    const auto result = service_.Submit(RunRequest{"hello.sh", 10}, true);
    ASSERT_TRUE(result.Accepted());
    ASSERT_TRUE(result.subscription);
    EXPECT_EQ(result.run_id.size(), 36u);

    const auto events = testing::CollectEvents(result.subscription);
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[0].kind, bus::EventKind::kStart);
    EXPECT_EQ(events[0].run_id, result.run_id);
    EXPECT_EQ(events[1].chunk, "hi\n");
    EXPECT_EQ(events[2].kind, bus::EventKind::kExit);
    EXPECT_EQ(events[2].exit_code, 0);
    EXPECT_FALSE(events[2].signal.has_value());

    ASSERT_TRUE(WaitForIdle());
    EXPECT_FALSE(service_.Query(result.run_id).has_value());
    EXPECT_EQ(service_.Subscribe(result.run_id), nullptr);
    EXPECT_FALSE(service_.Cancel(result.run_id));
}

TEST_F(RunServiceTest, ClampsRequestedTimeout) {
    dir_.Write("pause.sh", "sleep 3\n");
    const auto result = service_.Submit(RunRequest{"pause.sh", 0}, true);
    ASSERT_TRUE(result.Accepted());
    const auto session = service_.Query(result.run_id);
    ASSERT_TRUE(session.has_value());
    EXPECT_EQ(session->timeout_seconds, kMinTimeoutSeconds);

    const auto events = testing::CollectEvents(result.subscription);
    ASSERT_FALSE(events.empty());
    EXPECT_TRUE(events.back().timed_out);
}

TEST_F(RunServiceTest, TimedOutRunEndsWithKillSignal) {
    dir_.Write("forever.sh", "sleep 120\n");
    const auto started = std::chrono::steady_clock::now();
    const auto result = service_.Submit(RunRequest{"forever.sh", 1}, true);
    ASSERT_TRUE(result.Accepted());

    const auto events = testing::CollectEvents(result.subscription);
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].kind, bus::EventKind::kStart);
    EXPECT_EQ(events[1].kind, bus::EventKind::kExit);
    EXPECT_FALSE(events[1].exit_code.has_value());
    EXPECT_EQ(events[1].signal, "SIGKILL");
    EXPECT_LT(std::chrono::steady_clock::now() - started, 4s);
    EXPECT_TRUE(WaitForIdle());
}

TEST_F(RunServiceTest, LateSubscriberMissesStartButGetsTheRest) {
    dir_.Write("slow.sh", "sleep 1\necho late\n");
    const auto result = service_.Submit(RunRequest{"slow.sh", 10}, true);
    ASSERT_TRUE(result.Accepted());

    bus::RunEvent event{};
    ASSERT_EQ(result.subscription->Next(event, 5s), bus::Subscription::WaitResult::kEvent);
    ASSERT_EQ(event.kind, bus::EventKind::kStart);

    auto late = service_.Subscribe(result.run_id);
    ASSERT_TRUE(late);
    const auto events = testing::CollectEvents(late);
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].kind, bus::EventKind::kStdout);
    EXPECT_EQ(events[0].chunk, "late\n");
    EXPECT_EQ(events[1].kind, bus::EventKind::kExit);
}

TEST_F(RunServiceTest, CancelStopsAnActiveRun) {
    dir_.Write("long.sh", "sleep 120\n");
    const auto result = service_.Submit(RunRequest{"long.sh", 60}, true);
    ASSERT_TRUE(result.Accepted());

    bus::RunEvent event{};
    ASSERT_EQ(result.subscription->Next(event, 5s), bus::Subscription::WaitResult::kEvent);
    EXPECT_TRUE(service_.Cancel(result.run_id));

    const auto events = testing::CollectEvents(result.subscription);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].signal, "SIGKILL");
    EXPECT_FALSE(events[0].timed_out);
    EXPECT_TRUE(WaitForIdle());
}

TEST_F(RunServiceTest, CancelOfUnknownRunIsRejected) {
    EXPECT_FALSE(service_.Cancel("00000000-0000-0000-0000-000000000000"));
    EXPECT_FALSE(service_.Query("00000000-0000-0000-0000-000000000000").has_value());
}

TEST_F(RunServiceTest, ConcurrentSubmissionsGetDistinctRuns) {
    dir_.Write("quick.sh", "echo $$\n");
    std::vector<SubmitResult> results;
    for (int i = 0; i < 6; ++i) {
        results.push_back(service_.Submit(RunRequest{"quick.sh", 10}, true));
    }
    std::set<std::string> ids;
    for (const auto& result : results) {
        ASSERT_TRUE(result.Accepted());
        ids.insert(result.run_id);
        const auto events = testing::CollectEvents(result.subscription);
        ASSERT_FALSE(events.empty());
        EXPECT_EQ(events.front().kind, bus::EventKind::kStart);
        EXPECT_EQ(events.back().exit_code, 0);
        for (const auto& event : events) {
            EXPECT_EQ(event.run_id, result.run_id);
        }
    }
    EXPECT_EQ(ids.size(), results.size());
    EXPECT_TRUE(WaitForIdle());
}

}  // namespace
}  // namespace scriptbox::run
