// ═══════════════════════════════════════════════════════════════════
//  src/health_monitor.cpp — Check scheduling and state transitions
// ═══════════════════════════════════════════════════════════════════

#include "fedgate/health_monitor.h"
#include "fedgate/console.h"
#include <thread>

namespace fedgate::health {

std::string_view toString(HealthState state) {
    switch (state) {
        case HealthState::Healthy:  return "healthy";
        case HealthState::Degraded: return "degraded";
        case HealthState::Down:     return "down";
    }
    return "healthy";
}

nlohmann::json SubgraphHealth::toJson() const {
    nlohmann::json j = {
        {"name", name},
        {"state", std::string(toString(state))},
        {"consecutiveBad", consecutiveBad},
        {"consecutiveFailures", consecutiveFailures},
        {"checks", checks},
        {"lastLatencyMs", lastLatency.count()}
    };
    if (!lastError.empty()) j["lastError"] = lastError;
    return j;
}

HealthMonitor::HealthMonitor(std::shared_ptr<client::SubgraphClient> client, HealthOptions options)
    : client_(std::move(client))
    , options_(options)
    , snapshot_(std::make_shared<const HealthSnapshot>()) {}

HealthMonitor::~HealthMonitor() {
    stop();
}

void HealthMonitor::setTargets(std::vector<client::CheckTarget> targets) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto current = snapshot_.load();
    auto next = std::make_shared<HealthSnapshot>();
    for (auto& target : targets) {
        auto it = current->find(target.subgraph);
        if (it != current->end()) {
            (*next)[target.subgraph] = it->second;
        } else {
            SubgraphHealth fresh;
            fresh.name = target.subgraph;
            (*next)[target.subgraph] = fresh;
        }
    }
    targets_ = std::move(targets);
    snapshot_.store(std::move(next));
}

void HealthMonitor::setOptions(HealthOptions options) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        options_ = options;
    }
    // Restart so a new interval takes effect
    if (running()) {
        stop();
        start();
    }
}

HealthOptions HealthMonitor::options() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return options_;
}

void HealthMonitor::onTransition(TransitionListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_.push_back(std::move(listener));
}

void HealthMonitor::start() {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    if (poller_.active()) return;
    auto options = this->options();
    poller_.start([this] { pollOnce(); }, options.intervalMs);
    console::info("Health monitor polling every", std::to_string(options.intervalMs) + "ms");
}

void HealthMonitor::stop() {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    poller_.stop();
}

bool HealthMonitor::running() const {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    return poller_.active();
}

void HealthMonitor::pollOnce() {
    std::vector<client::CheckTarget> targets;
    HealthOptions options;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        targets = targets_;
        options = options_;
    }

    std::vector<std::thread> checks;
    checks.reserve(targets.size());
    for (auto& target : targets) {
        checks.emplace_back([this, target, options] {
            auto timeout = std::chrono::milliseconds(options.timeoutMs);
            auto start = std::chrono::steady_clock::now();
            bool success = true;
            std::string error;
            try {
                client_->checkHealth(target, timeout);
            } catch (const std::exception& e) {
                success = false;
                error = e.what();
            }
            auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start);
            if (success && latency > timeout) {
                success = false;
                error = "check exceeded " + std::to_string(options.timeoutMs) + "ms";
            }
            recordCheck(target.subgraph, success, latency, error);
        });
    }
    for (auto& check : checks) check.join();
}

void HealthMonitor::recordCheck(const std::string& subgraph, bool success,
                                std::chrono::milliseconds latency, const std::string& error) {
    HealthState from;
    HealthState to;
    std::vector<TransitionListener> listeners;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto next = std::make_shared<HealthSnapshot>(*snapshot_.load());
        auto& entry = (*next)[subgraph];
        entry.name = subgraph;
        entry.checks++;
        entry.lastLatency = latency;
        entry.lastError = success ? "" : error;

        bool slow = success && latency.count() > options_.slowThresholdMs;
        if (slow) entry.lastError = "slow check (" + std::to_string(latency.count()) + "ms)";
        from = entry.state;

        if (success) {
            entry.consecutiveFailures = 0;
            entry.consecutiveBad = slow ? entry.consecutiveBad + 1 : 0;
            if (entry.state == HealthState::Down) {
                entry.state = HealthState::Healthy;
                entry.consecutiveBad = slow ? 1 : 0;
            } else if (entry.state == HealthState::Degraded && !slow) {
                entry.state = HealthState::Healthy;
            } else if (entry.state == HealthState::Healthy &&
                       entry.consecutiveBad >= options_.degradedAfter) {
                entry.state = HealthState::Degraded;
            }
        } else {
            entry.consecutiveBad++;
            entry.consecutiveFailures++;
            if (entry.state == HealthState::Healthy &&
                entry.consecutiveBad >= options_.degradedAfter) {
                entry.state = HealthState::Degraded;
                entry.consecutiveFailures = 0;
            } else if (entry.state == HealthState::Degraded &&
                       entry.consecutiveFailures >= options_.downAfter) {
                entry.state = HealthState::Down;
            }
        }

        to = entry.state;
        snapshot_.store(std::move(next));
        if (from != to) listeners = listeners_;
    }

    if (from == to) return;
    auto message = "Subgraph '" + subgraph + "' " + std::string(toString(from)) + " -> " +
                   std::string(toString(to));
    if (to == HealthState::Healthy) {
        console::success(message);
    } else if (to == HealthState::Down) {
        console::error(message, error.empty() ? "" : "(" + error + ")");
    } else {
        console::warn(message);
    }
    for (auto& listener : listeners) listener(subgraph, from, to);
}

HealthState HealthMonitor::state(const std::string& subgraph) const {
    auto snap = snapshot_.load();
    auto it = snap->find(subgraph);
    return it == snap->end() ? HealthState::Healthy : it->second.state;
}

bool HealthMonitor::isDown(const std::string& subgraph) const {
    return state(subgraph) == HealthState::Down;
}

std::set<std::string> HealthMonitor::downSubgraphs() const {
    std::set<std::string> out;
    for (auto& [name, entry] : *snapshot_.load()) {
        if (entry.state == HealthState::Down) out.insert(name);
    }
    return out;
}

} // namespace fedgate::health
