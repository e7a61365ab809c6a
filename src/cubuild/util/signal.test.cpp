#include "./signal.hpp"

#include <catch2/catch.hpp>

#include <csignal>

#include <signal.h>

TEST_CASE("A signal is recorded, and only the first one is caught") {
    cubuild::reset_cancelled();
    cubuild::install_signal_handlers();
    CHECK_NOTHROW(cubuild::cancellation_point());

    std::raise(SIGTERM);
    CHECK(cubuild::is_cancelled());
    CHECK_THROWS_AS(cubuild::cancellation_point(), cubuild::user_cancelled);

    struct ::sigaction current = {};
    ::sigaction(SIGTERM, nullptr, &current);
    CHECK(current.sa_handler == SIG_DFL);

    cubuild::reset_cancelled();
    CHECK_FALSE(cubuild::is_cancelled());
}
