#pragma once
// ═══════════════════════════════════════════════════════════════════
//  forgepp/console.h — Colored build progress logging
// ═══════════════════════════════════════════════════════════════════
//
//  console::info("Found", 3, "layers");
//  console::step(3, "BUILD LAMBDA LAYERS");
//  console::debug("only printed with --verbose");
//
// ═══════════════════════════════════════════════════════════════════

#include <atomic>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <nlohmann/json.hpp>

namespace forgepp::console {

namespace detail {

struct Colors {
    static constexpr const char* Reset   = "\033[0m";
    static constexpr const char* Red     = "\033[31m";
    static constexpr const char* Yellow  = "\033[33m";
    static constexpr const char* Blue    = "\033[34m";
    static constexpr const char* Cyan    = "\033[36m";
    static constexpr const char* Green   = "\033[32m";
    static constexpr const char* Gray    = "\033[90m";
    static constexpr const char* Bold    = "\033[1m";
};

inline std::atomic<bool>& verbose() {
    static std::atomic<bool> v{false};
    return v;
}

// Lines from concurrently built units must not interleave
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
        if constexpr (std::is_floating_point_v<T>) {
            std::ostringstream oss;
            oss << arg;
            return oss.str();
        }
        return std::to_string(arg);
    } else if constexpr (requires { nlohmann::json(arg).dump(); }) {
        return nlohmann::json(arg).dump(2);
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
    std::tm local{};
    localtime_r(&time, &local);
    std::ostringstream oss;
    oss << std::put_time(&local, "%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

template <typename... Args>
void print(std::ostream& os, const char* color, const char* prefix, const Args&... args) {
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

    std::lock_guard<std::mutex> lock(outputMutex());
    os << line.str() << std::endl;
}

} // namespace detail

// ── Verbose switch (gates console::debug) ──
inline void setVerbose(bool enabled) { detail::verbose().store(enabled); }
inline bool isVerbose() { return detail::verbose().load(); }

template <typename... Args>
void log(const Args&... args) {
    detail::print(std::cout, detail::Colors::Reset, "", args...);
}

template <typename... Args>
void info(const Args&... args) {
    detail::print(std::cout, detail::Colors::Blue, "ℹ ", args...);
}

template <typename... Args>
void warn(const Args&... args) {
    detail::print(std::cerr, detail::Colors::Yellow, "⚠ ", args...);
}

template <typename... Args>
void error(const Args&... args) {
    detail::print(std::cerr, detail::Colors::Red, "✖ ", args...);
}

template <typename... Args>
void success(const Args&... args) {
    detail::print(std::cout, detail::Colors::Green, "✔ ", args...);
}

template <typename... Args>
void debug(const Args&... args) {
    if (!isVerbose()) return;
    detail::print(std::cout, detail::Colors::Cyan, "● ", args...);
}

// ── Phase banner ──
inline void step(int number, const std::string& title) {
    static constexpr const char* rule = "═════════════════════════════════════";
    std::lock_guard<std::mutex> lock(detail::outputMutex());
    std::cout << "\n" << detail::Colors::Bold << rule << detail::Colors::Reset << "\n"
              << detail::Colors::Bold << "STEP " << number << ": " << title
              << detail::Colors::Reset << "\n"
              << detail::Colors::Bold << rule << detail::Colors::Reset << "\n"
              << std::endl;
}

} // namespace forgepp::console
