#pragma once
// ═══════════════════════════════════════════════════════════════════
//  fedgate/health_monitor.h — Subgraph liveness polling
// ═══════════════════════════════════════════════════════════════════
//
//  State machine per subgraph (a check is bad when it fails or is slow):
//
//    Healthy  --degradedAfter bad checks-->        Degraded
//    Degraded --downAfter further failed checks--> Down
//    Degraded --good check-->                      Healthy
//    Down     --successful check-->                Healthy
//
//  The table is published as an immutable snapshot; the planner and
//  executor read it without locking.
// ═══════════════════════════════════════════════════════════════════

#include "scheduler.h"
#include "subgraph_client.h"
#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace fedgate::health {

enum class HealthState { Healthy, Degraded, Down };

std::string_view toString(HealthState state);

struct SubgraphHealth {
    std::string name;
    HealthState state = HealthState::Healthy;
    int consecutiveBad = 0;         // failed or slow checks in a row
    int consecutiveFailures = 0;    // failed checks in a row since the last state change
    std::uint64_t checks = 0;
    std::chrono::milliseconds lastLatency{0};
    std::string lastError;

    nlohmann::json toJson() const;
};

struct HealthOptions {
    int intervalMs = 5000;
    int timeoutMs = 2000;
    int slowThresholdMs = 1000;
    int degradedAfter = 2;
    int downAfter = 3;
};

using HealthSnapshot = std::map<std::string, SubgraphHealth>;
using TransitionListener = std::function<void(const std::string& subgraph,
                                              HealthState from, HealthState to)>;

class HealthMonitor {
public:
    explicit HealthMonitor(std::shared_ptr<client::SubgraphClient> client,
                           HealthOptions options = {});
    ~HealthMonitor();

    HealthMonitor(const HealthMonitor&) = delete;
    HealthMonitor& operator=(const HealthMonitor&) = delete;

    // Replace the checked set; state of subgraphs that remain is kept
    void setTargets(std::vector<client::CheckTarget> targets);
    void setOptions(HealthOptions options);
    HealthOptions options() const;

    void onTransition(TransitionListener listener);

    // Background polling every intervalMs
    void start();
    void stop();
    bool running() const;

    // Check every target once, concurrently, and record the outcomes
    void pollOnce();

    // Apply one check outcome to the state machine
    void recordCheck(const std::string& subgraph, bool success,
                     std::chrono::milliseconds latency, const std::string& error = "");

    std::shared_ptr<const HealthSnapshot> snapshot() const { return snapshot_.load(); }
    HealthState state(const std::string& subgraph) const;
    bool isDown(const std::string& subgraph) const;
    std::set<std::string> downSubgraphs() const;

private:
    std::shared_ptr<client::SubgraphClient> client_;
    HealthOptions options_;
    std::vector<client::CheckTarget> targets_;
    std::vector<TransitionListener> listeners_;
    mutable std::mutex mutex_;     // writer side: options, targets, listeners, table
    std::atomic<std::shared_ptr<const HealthSnapshot>> snapshot_;
    mutable std::mutex lifecycleMutex_;  // start/stop
    scheduler::Interval poller_;
};

} // namespace fedgate::health
