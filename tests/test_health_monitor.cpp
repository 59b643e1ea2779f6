// ═══════════════════════════════════════════════════════════════════
//  test_health_monitor.cpp — Check outcomes and state transitions
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include "federation_fixtures.h"
#include "fedgate/health_monitor.h"

using namespace fedgate;
using namespace fedgate::health;
using namespace std::chrono_literals;

namespace {

class HealthMonitorTest : public ::testing::Test {
protected:
    void SetUp() override {
        client_ = std::make_shared<fixtures::ScriptedClient>();
        monitor_ = std::make_unique<HealthMonitor>(client_, HealthOptions{
            .intervalMs = 20, .timeoutMs = 200, .slowThresholdMs = 100, .degradedAfter = 2, .downAfter = 3});
        monitor_->setTargets({{"workflow", "http://workflow.local/graphql", ""},
                              {"execution", "http://execution.local/graphql", ""}});
    }

    void fail(int times) {
        for (int i = 0; i < times; ++i) monitor_->recordCheck("execution", false, 5ms, "connection refused");
    }

    std::shared_ptr<fixtures::ScriptedClient> client_;
    std::unique_ptr<HealthMonitor> monitor_;
};

} // namespace

// ═══════════════════════════════════════════
//  State machine
// ═══════════════════════════════════════════

TEST_F(HealthMonitorTest, StartsHealthy) {
    EXPECT_EQ(monitor_->state("workflow"), HealthState::Healthy);
    EXPECT_EQ(monitor_->state("unknown"), HealthState::Healthy);
    EXPECT_TRUE(monitor_->downSubgraphs().empty());
    EXPECT_EQ(monitor_->snapshot()->size(), 2u);
}

TEST_F(HealthMonitorTest, FailuresDegradeThenTakeDown) {
    fail(1);
    EXPECT_EQ(monitor_->state("execution"), HealthState::Healthy);
    fail(1);
    EXPECT_EQ(monitor_->state("execution"), HealthState::Degraded);
    fail(2);
    EXPECT_EQ(monitor_->state("execution"), HealthState::Degraded);
    fail(1);
    EXPECT_EQ(monitor_->state("execution"), HealthState::Down);
    EXPECT_TRUE(monitor_->isDown("execution"));
    EXPECT_EQ(monitor_->downSubgraphs(), (std::set<std::string>{"execution"}));

    auto entry = monitor_->snapshot()->at("execution");
    EXPECT_EQ(entry.checks, 5u);
    EXPECT_EQ(entry.lastError, "connection refused");
}

TEST_F(HealthMonitorTest, DownRecoversStraightToHealthy) {
    fail(5);
    ASSERT_EQ(monitor_->state("execution"), HealthState::Down);
    monitor_->recordCheck("execution", true, 5ms);
    EXPECT_EQ(monitor_->state("execution"), HealthState::Healthy);
    EXPECT_EQ(monitor_->snapshot()->at("execution").consecutiveBad, 0);
}

TEST_F(HealthMonitorTest, DegradedNeedsAGoodCheck) {
    fail(2);
    monitor_->recordCheck("execution", true, 150ms);
    EXPECT_EQ(monitor_->state("execution"), HealthState::Degraded);
    monitor_->recordCheck("execution", true, 10ms);
    EXPECT_EQ(monitor_->state("execution"), HealthState::Healthy);
}

TEST_F(HealthMonitorTest, SlowChecksDegradeButNeverTakeDown) {
    for (int i = 0; i < 10; ++i) monitor_->recordCheck("workflow", true, 150ms);
    EXPECT_EQ(monitor_->state("workflow"), HealthState::Degraded);
    EXPECT_NE(monitor_->snapshot()->at("workflow").lastError.find("slow check"), std::string::npos);
}

TEST_F(HealthMonitorTest, ListenersSeeEveryTransition) {
    std::vector<std::pair<HealthState, HealthState>> seen;
    monitor_->onTransition([&](const std::string& subgraph, HealthState from, HealthState to) {
        EXPECT_EQ(subgraph, "execution");
        seen.emplace_back(from, to);
    });

    fail(5);
    monitor_->recordCheck("execution", true, 1ms);
    ASSERT_EQ(seen.size(), 3u);
    EXPECT_EQ(seen[0], std::make_pair(HealthState::Healthy, HealthState::Degraded));
    EXPECT_EQ(seen[1], std::make_pair(HealthState::Degraded, HealthState::Down));
    EXPECT_EQ(seen[2], std::make_pair(HealthState::Down, HealthState::Healthy));
}

TEST_F(HealthMonitorTest, TargetsKeepStateOfRemainingSubgraphs) {
    fail(5);
    monitor_->setTargets({{"execution", "http://execution.local/graphql", ""},
                          {"ticket", "http://ticket.local/graphql", ""}});
    auto snapshot = monitor_->snapshot();
    EXPECT_EQ(snapshot->count("workflow"), 0u);
    EXPECT_EQ(snapshot->at("execution").state, HealthState::Down);
    EXPECT_EQ(snapshot->at("ticket").state, HealthState::Healthy);
}

TEST_F(HealthMonitorTest, SnapshotsAreImmutable) {
    auto before = monitor_->snapshot();
    fail(2);
    EXPECT_EQ(before->at("execution").state, HealthState::Healthy);
    EXPECT_EQ(monitor_->snapshot()->at("execution").state, HealthState::Degraded);
}

// ═══════════════════════════════════════════
//  Probing
// ═══════════════════════════════════════════

TEST_F(HealthMonitorTest, PollOnceChecksEveryTarget) {
    client_->setCheckFailure("execution", true);
    monitor_->pollOnce();
    monitor_->pollOnce();

    EXPECT_EQ(client_->checks(), 4);
    EXPECT_EQ(monitor_->state("workflow"), HealthState::Healthy);
    EXPECT_EQ(monitor_->state("execution"), HealthState::Degraded);
    EXPECT_NE(monitor_->snapshot()->at("execution").lastError.find("connection refused"), std::string::npos);
}

TEST_F(HealthMonitorTest, BackgroundPolling) {
    monitor_->start();
    EXPECT_TRUE(monitor_->running());
    std::this_thread::sleep_for(120ms);
    monitor_->stop();
    EXPECT_FALSE(monitor_->running());

    auto checked = client_->checks();
    EXPECT_GE(checked, 2);
    std::this_thread::sleep_for(60ms);
    EXPECT_EQ(client_->checks(), checked);
}

TEST_F(HealthMonitorTest, OptionsCanChangeWhileRunning) {
    monitor_->start();
    monitor_->setOptions({.intervalMs = 1000, .timeoutMs = 500, .slowThresholdMs = 300,
                          .degradedAfter = 1, .downAfter = 1});
    EXPECT_TRUE(monitor_->running());
    EXPECT_EQ(monitor_->options().degradedAfter, 1);
    monitor_->stop();

    fail(1);
    EXPECT_EQ(monitor_->state("execution"), HealthState::Degraded);
    fail(1);
    EXPECT_EQ(monitor_->state("execution"), HealthState::Down);
}

TEST(HealthStateTest, Names) {
    EXPECT_EQ(toString(HealthState::Healthy), "healthy");
    EXPECT_EQ(toString(HealthState::Degraded), "degraded");
    EXPECT_EQ(toString(HealthState::Down), "down");

    SubgraphHealth entry;
    entry.name = "workflow";
    auto j = entry.toJson();
    EXPECT_EQ(j["state"], "healthy");
    EXPECT_FALSE(j.contains("lastError"));
}
