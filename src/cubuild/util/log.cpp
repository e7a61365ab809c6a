#include "./log.hpp"

#include <neo/assert.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

using namespace cubuild;

namespace {

/**
 * Progress messages are printed bare, so that they read like the build log they are interleaved
 * with. Everything else carries its severity as a prefix.
 */
std::string_view prefix_of(log::level l) noexcept {
    switch (l) {
    case log::level::trace:
        return "[trace] ";
    case log::level::debug:
        return "[debug] ";
    case log::level::info:
    case log::level::error:
    case log::level::silent:
        return "";
    case log::level::warn:
        return "Warning: ";
    case log::level::critical:
        return "[critical] ";
    }
    return "";
}

spdlog::level::level_enum spdlog_level_of(log::level l, std::string_view msg) noexcept {
    switch (l) {
    case log::level::trace:
        return spdlog::level::trace;
    case log::level::debug:
        return spdlog::level::debug;
    case log::level::info:
        return spdlog::level::info;
    case log::level::warn:
        return spdlog::level::warn;
    case log::level::error:
        return spdlog::level::err;
    case log::level::critical:
        return spdlog::level::critical;
    case log::level::silent:
        return spdlog::level::off;
    }
    neo_assert_always(invariant, false, "Invalid log level", msg, int(l));
}

/// The logger writes to stdout, in the same stream as the output of the tools that we run
spdlog::logger& cubuild_logger() {
    static auto inst = [] {
        auto logger = spdlog::stdout_color_mt("cubuild");
        logger->set_level(spdlog::level::trace);
        logger->set_pattern("%^%v%$");
        return logger;
    }();
    return *inst;
}

}  // namespace

void cubuild::log::init_logger() noexcept { cubuild_logger().flush(); }

void cubuild::log::log_print(level l, std::string_view msg) noexcept {
    auto& logger = cubuild_logger();
    logger.log(spdlog_level_of(l, msg), "{}{}", prefix_of(l), msg);
    if (l >= level::warn) {
        // Diagnostics must not be held back behind the output of a child process
        logger.flush();
    }
}
