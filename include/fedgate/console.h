#pragma once
// ═══════════════════════════════════════════════════════════════════
//  fedgate/console.h — Leveled, colored console logging
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    console::setLevel(console::Level::Debug);
//    console::info("composed schema generation", gen);
//    console::warn("subgraph", name, "is degraded");
//
//  Output is serialized: fetch tasks log from several threads. Colors
//  are used on terminals only; setSink() captures lines instead.
// ═══════════════════════════════════════════════════════════════════

#include <atomic>
#include <chrono>
#include <functional>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <unistd.h>
#include <nlohmann/json.hpp>

namespace fedgate::console {

enum class Level { Debug = 0, Info = 1, Warn = 2, Error = 3, Silent = 4 };

// Receives each formatted line without timestamp or colors
using Sink = std::function<void(Level, const std::string& line)>;

namespace detail {

struct Colors {
    static constexpr const char* Reset   = "\033[0m";
    static constexpr const char* Red     = "\033[31m";
    static constexpr const char* Yellow  = "\033[33m";
    static constexpr const char* Blue    = "\033[34m";
    static constexpr const char* Cyan    = "\033[36m";
    static constexpr const char* Green   = "\033[32m";
    static constexpr const char* Gray    = "\033[90m";
};

inline std::atomic<int>& threshold() {
    static std::atomic<int> level{static_cast<int>(Level::Info)};
    return level;
}

inline std::mutex& outputMutex() {
    static std::mutex m;
    return m;
}

template <typename T>
std::string stringify(const T& arg) {
    if constexpr (std::is_convertible_v<T, std::string_view>) {
        return std::string(std::string_view(arg));
    } else if constexpr (std::is_same_v<std::decay_t<T>, bool>) {
        return arg ? "true" : "false";
    } else if constexpr (std::is_arithmetic_v<T>) {
        std::ostringstream oss;
        oss << arg;
        return oss.str();
    } else if constexpr (std::is_same_v<std::decay_t<T>, nlohmann::json>) {
        return arg.dump();
    } else {
        std::ostringstream oss;
        oss << arg;
        return oss.str();
    }
}

inline std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    std::tm tm{};
    localtime_r(&time, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

inline Sink& sink() {
    static Sink installed;
    return installed;
}

// Escape codes only when the stream is a terminal
inline bool colorEnabled(const std::ostream& os) {
    static const bool outTty = ::isatty(STDOUT_FILENO) == 1;
    static const bool errTty = ::isatty(STDERR_FILENO) == 1;
    return &os == &std::cerr ? errTty : outTty;
}

template <typename... Args>
void print(Level level, std::ostream& os, const char* color, const char* prefix,
           const Args&... args) {
    if (static_cast<int>(level) < threshold().load()) return;

    // Format first so the lock only covers the write
    std::string message = prefix;
    bool first = true;
    auto append = [&](const auto& arg) {
        if (!first) message += ' ';
        first = false;
        message += stringify(arg);
    };
    (append(args), ...);

    std::lock_guard<std::mutex> lock(outputMutex());
    if (sink()) {
        sink()(level, message);
        return;
    }
    if (colorEnabled(os)) {
        os << Colors::Gray << '[' << timestamp() << "] " << color << message << Colors::Reset << '\n';
    } else {
        os << '[' << timestamp() << "] " << message << '\n';
    }
    os.flush();
}

} // namespace detail

// Route every line to `sink` instead of stdout/stderr; nullptr restores them
inline void setSink(Sink sink) {
    std::lock_guard<std::mutex> lock(detail::outputMutex());
    detail::sink() = std::move(sink);
}

// ── Global threshold ──
inline void setLevel(Level level) {
    detail::threshold().store(static_cast<int>(level));
}

inline Level level() {
    return static_cast<Level>(detail::threshold().load());
}

// "debug" | "info" | "warn" | "error" | "silent"
inline Level parseLevel(const std::string& name) {
    if (name == "debug")  return Level::Debug;
    if (name == "info")   return Level::Info;
    if (name == "warn" || name == "warning") return Level::Warn;
    if (name == "error")  return Level::Error;
    if (name == "silent" || name == "off") return Level::Silent;
    throw std::invalid_argument("Unknown log level '" + name + "'");
}

template <typename... Args>
void log(const Args&... args) {
    detail::print(Level::Info, std::cout, detail::Colors::Reset, "", args...);
}

template <typename... Args>
void info(const Args&... args) {
    detail::print(Level::Info, std::cout, detail::Colors::Blue, "ℹ ", args...);
}

template <typename... Args>
void warn(const Args&... args) {
    detail::print(Level::Warn, std::cerr, detail::Colors::Yellow, "⚠ ", args...);
}

template <typename... Args>
void error(const Args&... args) {
    detail::print(Level::Error, std::cerr, detail::Colors::Red, "✖ ", args...);
}

template <typename... Args>
void success(const Args&... args) {
    detail::print(Level::Info, std::cout, detail::Colors::Green, "✔ ", args...);
}

template <typename... Args>
void debug(const Args&... args) {
    detail::print(Level::Debug, std::cout, detail::Colors::Cyan, "● ", args...);
}

} // namespace fedgate::console
