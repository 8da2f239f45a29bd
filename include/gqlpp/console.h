#pragma once
// ═══════════════════════════════════════════════════════════════════
//  gqlpp/console.h — Leveled, colored console logging
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    console::setLevel(console::Level::Debug);
//    console::debug("executing operation", name);
//
//  Resolver branches log from executor worker threads, so every line
//  is written under a single mutex.
// ═══════════════════════════════════════════════════════════════════

#include <chrono>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace gqlpp::console {

enum class Level { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

namespace detail {

// ANSI color codes
struct Colors {
    static constexpr const char* Reset   = "\033[0m";
    static constexpr const char* Red     = "\033[31m";
    static constexpr const char* Yellow  = "\033[33m";
    static constexpr const char* Blue    = "\033[34m";
    static constexpr const char* Cyan    = "\033[36m";
    static constexpr const char* Green   = "\033[32m";
    static constexpr const char* Gray    = "\033[90m";
};

struct State {
    std::mutex mutex;
    Level level = Level::Info;
    std::ostream* out = nullptr;   // nullptr: stdout/stderr by level
};

inline State& state() {
    static State s;
    return s;
}

// Stringify a single argument
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
    } else if constexpr (requires { arg.dump(); }) {
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

template <typename... Args>
void print(Level level, bool toErr, const char* color, const char* prefix, const Args&... args) {
    auto& s = state();
    {
        std::lock_guard<std::mutex> lock(s.mutex);
        if (level < s.level) return;
    }

    std::ostringstream line;
    line << Colors::Gray << "[" << timestamp() << "] "
         << color << prefix << Colors::Reset;
    bool first = true;
    auto printOne = [&](const auto& arg) {
        if (!first) line << " ";
        first = false;
        line << stringify(arg);
    };
    (printOne(args), ...);

    std::lock_guard<std::mutex> lock(s.mutex);
    std::ostream& os = s.out ? *s.out : (toErr ? std::cerr : std::cout);
    os << line.str() << std::endl;
}

} // namespace detail

// ── Minimum level that is written ──
inline void setLevel(Level level) {
    std::lock_guard<std::mutex> lock(detail::state().mutex);
    detail::state().level = level;
}

inline Level level() {
    std::lock_guard<std::mutex> lock(detail::state().mutex);
    return detail::state().level;
}

// ── Redirect all output (nullptr restores stdout/stderr) ──
inline void setOutput(std::ostream* out) {
    std::lock_guard<std::mutex> lock(detail::state().mutex);
    detail::state().out = out;
}

// ── "debug" | "info" | "warn" | "error" | "off" ──
inline Level parseLevel(const std::string& name) {
    if (name == "debug") return Level::Debug;
    if (name == "info")  return Level::Info;
    if (name == "warn")  return Level::Warn;
    if (name == "error") return Level::Error;
    if (name == "off")   return Level::Off;
    throw std::invalid_argument("Unknown log level '" + name + "'");
}

// ── console::log ──
template <typename... Args>
void log(const Args&... args) {
    detail::print(Level::Info, false, detail::Colors::Reset, "", args...);
}

// ── console::info ──
template <typename... Args>
void info(const Args&... args) {
    detail::print(Level::Info, false, detail::Colors::Blue, "ℹ ", args...);
}

// ── console::warn ──
template <typename... Args>
void warn(const Args&... args) {
    detail::print(Level::Warn, true, detail::Colors::Yellow, "⚠ ", args...);
}

// ── console::error ──
template <typename... Args>
void error(const Args&... args) {
    detail::print(Level::Error, true, detail::Colors::Red, "✖ ", args...);
}

// ── console::success ──
template <typename... Args>
void success(const Args&... args) {
    detail::print(Level::Info, false, detail::Colors::Green, "✔ ", args...);
}

// ── console::debug ──
template <typename... Args>
void debug(const Args&... args) {
    detail::print(Level::Debug, false, detail::Colors::Cyan, "● ", args...);
}

// ── console::time / console::timeEnd ──
namespace detail {
    inline std::unordered_map<std::string, std::chrono::steady_clock::time_point>& timers() {
        static std::unordered_map<std::string, std::chrono::steady_clock::time_point> t;
        return t;
    }
}

inline void time(const std::string& label) {
    std::lock_guard<std::mutex> lock(detail::state().mutex);
    detail::timers()[label] = std::chrono::steady_clock::now();
}

inline void timeEnd(const std::string& label) {
    std::chrono::steady_clock::duration elapsed{};
    {
        std::lock_guard<std::mutex> lock(detail::state().mutex);
        auto it = detail::timers().find(label);
        if (it == detail::timers().end()) {
            elapsed = std::chrono::steady_clock::duration::min();
        } else {
            elapsed = std::chrono::steady_clock::now() - it->second;
            detail::timers().erase(it);
        }
    }
    if (elapsed == std::chrono::steady_clock::duration::min()) {
        warn("Timer '" + label + "' does not exist");
        return;
    }
    auto ms = std::chrono::duration_cast<std::chrono::microseconds>(elapsed).count() / 1000.0;
    debug(label + ":", std::to_string(ms) + "ms");
}

} // namespace gqlpp::console
