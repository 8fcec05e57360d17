// core/log.h - Leveled, categorised diagnostic logging
// Part of the QoS route search library (C++20)
//
// Messages are formatted with fmt and written to stderr as
//   [level] category | message
// The threshold is process-wide and defaults to warning, so a library
// caller sees nothing unless a search fails loudly or logging is raised
// with set_log_level().  Writes are serialised so that solvers running
// side by side under compare_algorithms() do not interleave lines.
//
// Usage:
//   log_debug(log_category::genetic, "generation {} best {:.4f}", g, best);

#ifndef QOSROUTE_CORE_LOG_H
#define QOSROUTE_CORE_LOG_H

#include <fmt/format.h>

#include <atomic>
#include <cstdint>
#include <cstdio>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

namespace qosroute {

enum class log_level : int {
    trace,
    debug,
    info,
    warning,
    error,
    off,
};

enum class log_category : std::uint8_t {
    genetic,
    swarm,
    annealing,
    qlearning,
    dispatch,
};

[[nodiscard]] constexpr std::string_view to_string(log_level l) noexcept {
    switch (l) {
        case log_level::trace:   return "trace";
        case log_level::debug:   return "debug";
        case log_level::info:    return "info";
        case log_level::warning: return "warning";
        case log_level::error:   return "error";
        case log_level::off:     break;
    }
    return "off";
}

[[nodiscard]] constexpr std::string_view to_string(log_category c) noexcept {
    switch (c) {
        case log_category::genetic:   return "genetic";
        case log_category::swarm:     return "swarm";
        case log_category::annealing: return "annealing";
        case log_category::qlearning: return "qlearning";
        case log_category::dispatch:  return "dispatch";
    }
    return "unknown";
}

namespace detail {

inline std::atomic<log_level>& log_threshold() noexcept {
    static std::atomic<log_level> threshold{log_level::warning};
    return threshold;
}

inline std::mutex& log_mutex() noexcept {
    static std::mutex m;
    return m;
}

inline void write_log_line(log_level level, log_category category,
                           std::string const& message) {
    std::lock_guard<std::mutex> lock(log_mutex());
    fmt::print(stderr, "[{}] {} | {}\n",
               to_string(level), to_string(category), message);
}

} // namespace detail

inline void set_log_level(log_level level) noexcept {
    detail::log_threshold().store(level, std::memory_order_relaxed);
}

[[nodiscard]] inline log_level get_log_level() noexcept {
    return detail::log_threshold().load(std::memory_order_relaxed);
}

[[nodiscard]] inline bool log_enabled(log_level level) noexcept {
    return level != log_level::off && level >= get_log_level();
}

template<typename... Args>
void log_message(log_level level, log_category category,
                 fmt::format_string<Args...> format, Args&&... args) {
    if (!log_enabled(level)) return;
    detail::write_log_line(level, category,
                           fmt::format(format, std::forward<Args>(args)...));
}

template<typename... Args>
void log_trace(log_category c, fmt::format_string<Args...> f, Args&&... args) {
    log_message(log_level::trace, c, f, std::forward<Args>(args)...);
}

template<typename... Args>
void log_debug(log_category c, fmt::format_string<Args...> f, Args&&... args) {
    log_message(log_level::debug, c, f, std::forward<Args>(args)...);
}

template<typename... Args>
void log_info(log_category c, fmt::format_string<Args...> f, Args&&... args) {
    log_message(log_level::info, c, f, std::forward<Args>(args)...);
}

template<typename... Args>
void log_error(log_category c, fmt::format_string<Args...> f, Args&&... args) {
    log_message(log_level::error, c, f, std::forward<Args>(args)...);
}

} // namespace qosroute

#endif // QOSROUTE_CORE_LOG_H
