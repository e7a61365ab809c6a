#pragma once

#include <stdexcept>

namespace cubuild {

/// Thrown from a cancellation point after the user has interrupted the program
class user_cancelled : public std::exception {
public:
    const char* what() const noexcept override { return "Operation cancelled by the user"; }
};

/**
 * Route SIGINT and SIGTERM to notify_cancel(). The handlers are one-shot: A second signal
 * terminates the process immediately.
 */
void install_signal_handlers() noexcept;

/// Mark the program as cancelled. Safe to call from a signal handler.
void notify_cancel() noexcept;
/// Clear a previous cancellation
void reset_cancelled() noexcept;
[[nodiscard]] bool is_cancelled() noexcept;

/// Throw user_cancelled if a cancellation is pending
void cancellation_point();

}  // namespace cubuild
