#include "./signal.hpp"

#include <csignal>

#include <signal.h>

namespace {

volatile std::sig_atomic_t got_signal = 0;

extern "C" void record_signal(int sig) { got_signal = sig; }

void install_for(int sig) noexcept {
    struct ::sigaction act = {};
    act.sa_handler         = record_signal;
    ::sigemptyset(&act.sa_mask);
    // The handler is removed once it fires: A second ^C ends cubuild on the spot, while the first
    // lets the running tool exit and the pipeline stop at its next step.
    act.sa_flags = SA_RESETHAND | SA_RESTART;
    ::sigaction(sig, &act, nullptr);
}

}  // namespace

using namespace cubuild;

void cubuild::notify_cancel() noexcept { got_signal = SIGINT; }
void cubuild::reset_cancelled() noexcept { got_signal = 0; }

void cubuild::install_signal_handlers() noexcept {
    // The child process shares our process group, so it sees the same ^C and exits on its own.
    install_for(SIGINT);
    install_for(SIGTERM);
    install_for(SIGQUIT);
}

bool cubuild::is_cancelled() noexcept { return got_signal != 0; }

void cubuild::cancellation_point() {
    if (is_cancelled()) {
        throw user_cancelled();
    }
}
