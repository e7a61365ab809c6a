#pragma once

#include <fmt/core.h>

#include <string_view>

namespace cubuild::log {

/// Message severities, least severe first. `silent` disables all output when used as a threshold.
enum class level : int {
    trace,
    debug,
    info,
    warn,
    error,
    critical,
    silent,
};

/// The threshold set by --log-level. Messages below it are dropped before being formatted.
inline level current_log_level = level::info;

[[nodiscard]] inline bool enabled(level l) noexcept {
    return static_cast<int>(l) >= static_cast<int>(current_log_level);
}

/// Emit an already-formatted message, regardless of the current threshold
void log_print(level l, std::string_view msg) noexcept;

/// Create the process-wide logger. Called once at startup, before anything is logged.
void init_logger() noexcept;

template <typename T>
concept formattable = requires(const T item) {
    fmt::format("{}", item);
};

template <formattable... Args>
void log(level l, std::string_view fmt_str, const Args&... args) noexcept {
    if (enabled(l)) {
        log_print(l, fmt::format(fmt::runtime(fmt_str), args...));
    }
}

/**
 * Log a message at the named level. The arguments are not evaluated at all if the level is
 * disabled, so they may be expensive to compute.
 *
 *     cubuild_log(debug, "Running [{}]", quote_command(cmd));
 */
#define cubuild_log(Level, str, ...)                                                               \
    do {                                                                                           \
        if (::cubuild::log::enabled(::cubuild::log::level::Level)) {                               \
            ::cubuild::log::log(::cubuild::log::level::Level, str __VA_OPT__(, ) __VA_ARGS__);     \
        }                                                                                          \
    } while (0)

}  // namespace cubuild::log
