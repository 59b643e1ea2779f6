#pragma once
// ═══════════════════════════════════════════════════════════════════
//  fedgate/lifecycle.h — Shutdown and reload signals
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    lifecycle::SignalWatcher signals;
//    signals.onShutdown([&](int) { gateway.stop(); });
//    signals.onReload([&] { gateway.reload(config::loadConfig(path)); });
//    signals.watch(server);   // SIGINT/SIGTERM close `server`, SIGHUP reloads
//
//  Signals arrive through a boost::asio::signal_set on the watcher's
//  own thread, so handlers run as ordinary code. handle() takes the
//  same path synchronously.
// ═══════════════════════════════════════════════════════════════════

#include "http.h"
#include "console.h"
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <atomic>
#include <csignal>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace fedgate::lifecycle {

class SignalWatcher {
public:
    SignalWatcher() = default;
    ~SignalWatcher() { stop(); }

    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

    void onShutdown(std::function<void(int)> handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        shutdownHandlers_.push_back(std::move(handler));
    }

    void onReload(std::function<void()> handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        reloadHandlers_.push_back(std::move(handler));
    }

    // Close `server` on shutdown, after the other shutdown handlers
    void watch(http::Server& server) {
        server_ = &server;
        if (thread_.joinable()) return;
        signals_.async_wait([this](const boost::system::error_code& ec, int sig) { onSignal(ec, sig); });
        thread_ = std::thread([this] { ioc_.run(); });
    }

    // SIGHUP reloads; anything else shuts down, once
    void handle(int sig) {
        if (sig == SIGHUP) {
            reload();
            return;
        }
        if (shuttingDown_.exchange(true)) return;
        console::info("Received signal", sig, "- shutting down");

        std::vector<std::function<void(int)>> handlers;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            handlers = shutdownHandlers_;
        }
        for (auto& handler : handlers) handler(sig);
        if (server_) {
            server_->close();
            console::success("Server stopped");
        }
    }

    bool shuttingDown() const { return shuttingDown_.load(); }

    void stop() {
        ioc_.stop();
        if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) thread_.join();
    }

private:
    boost::asio::io_context ioc_{1};
    boost::asio::signal_set signals_{ioc_, SIGINT, SIGTERM, SIGHUP};
    std::thread thread_;
    http::Server* server_ = nullptr;
    std::atomic<bool> shuttingDown_{false};

    std::mutex mutex_;
    std::vector<std::function<void(int)>> shutdownHandlers_;
    std::vector<std::function<void()>> reloadHandlers_;

    void onSignal(const boost::system::error_code& ec, int sig) {
        if (ec) return;
        handle(sig);
        if (sig == SIGHUP) {
            signals_.async_wait([this](const boost::system::error_code& e, int s) { onSignal(e, s); });
        }
    }

    // A failed reload leaves the running configuration in place
    void reload() {
        console::info("Received SIGHUP - reloading configuration");
        std::vector<std::function<void()>> handlers;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            handlers = reloadHandlers_;
        }
        for (auto& handler : handlers) {
            try {
                handler();
            } catch (const std::exception& e) {
                console::error("Reload failed:", e.what());
            }
        }
    }
};

} // namespace fedgate::lifecycle
