#pragma once
// ═══════════════════════════════════════════════════════════════════
//  fedgate/scheduler.h — Cancellable timers for background polling
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    scheduler::Interval poller;
//    poller.start([&] { monitor.pollOnce(); }, 5000);
//    ...
//    poller.stop();   // wakes the sleeping thread and joins it
//
// ═══════════════════════════════════════════════════════════════════

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

namespace fedgate::scheduler {

// ── Timer handle for cancellation ──
class TimerHandle {
public:
    void cancel() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            cancelled_.store(true);
        }
        cv_.notify_all();
    }

    bool isCancelled() const { return cancelled_.load(); }

    // Sleep up to `duration`; false if cancelled meanwhile
    bool sleepFor(std::chrono::milliseconds duration) {
        std::unique_lock<std::mutex> lock(mutex_);
        return !cv_.wait_for(lock, duration, [this] { return cancelled_.load(); });
    }

private:
    std::atomic<bool> cancelled_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
};

// ═══════════════════════════════════════════
//  Interval — setInterval with an owned thread
//  The callback never runs after stop() returns.
// ═══════════════════════════════════════════
class Interval {
public:
    Interval() = default;
    ~Interval() { stop(); }

    Interval(const Interval&) = delete;
    Interval& operator=(const Interval&) = delete;

    void start(std::function<void()> callback, int ms) {
        stop();
        handle_ = std::make_shared<TimerHandle>();
        thread_ = std::thread([handle = handle_, callback = std::move(callback), ms]() {
            while (handle->sleepFor(std::chrono::milliseconds(ms))) callback();
        });
    }

    void stop() {
        if (handle_) handle_->cancel();
        if (thread_.joinable()) {
            // Stopped from inside the callback: the loop exits on its own
            if (thread_.get_id() == std::this_thread::get_id()) {
                thread_.detach();
            } else {
                thread_.join();
            }
        }
        handle_.reset();
    }

    bool active() const { return handle_ && !handle_->isCancelled(); }

private:
    std::shared_ptr<TimerHandle> handle_;
    std::thread thread_;
};

} // namespace fedgate::scheduler
