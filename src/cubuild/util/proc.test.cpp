#include "./proc.hpp"

#include <cubuild/cubuild.test.hpp>

#include <catch2/catch.hpp>

#include <filesystem>
#include <iterator>

namespace {

std::ptrdiff_t count_open_fds() {
    return std::distance(std::filesystem::directory_iterator("/proc/self/fd"),
                         std::filesystem::directory_iterator());
}

}  // namespace

TEST_CASE("Quote command arguments") {
    CHECK(cubuild::quote_argument("-DCMAKE_BUILD_TYPE=Release") == "-DCMAKE_BUILD_TYPE=Release");
    CHECK(cubuild::quote_argument("-DCMAKE_CUDA_ARCHITECTURES=70;75")
          == "\"-DCMAKE_CUDA_ARCHITECTURES=70;75\"");
    CHECK(cubuild::quote_argument("") == "\"\"");
    CHECK(cubuild::quote_argument("a|b") == "\"a|b\"");
    CHECK(cubuild::quote_argument("say \"hi\"") == "\"say \\\"hi\\\"\"");
    CHECK(cubuild::quote_command(std::vector<std::string>{"cmake", "--build", "."})
          == "cmake --build .");
}

TEST_CASE("Run a subprocess and collect its output") {
    auto res = cubuild::run_proc({"sh", "-c", "echo hello; echo oops >&2; exit 3"});
    CHECK_FALSE(res.okay());
    CHECK(res.retc == 3);
    CHECK(res.output == "hello\noops\n");
}

TEST_CASE("Run a subprocess in a working directory") {
    auto tmp = cubuild::testing::scratch_dir::create();
    auto res = cubuild::run_proc(cubuild::proc_options{
        .command = {"sh", "-c", "pwd -P"},
        .cwd     = tmp.path(),
    });
    REQUIRE(res.okay());
    CHECK(cubuild::fs::equivalent(cubuild::fs::path(res.output.substr(0, res.output.size() - 1)),
                                  tmp.path()));
}

TEST_CASE("A missing executable fails without throwing") {
    auto res = cubuild::run_proc({"cubuild-no-such-program-exists"});
    CHECK_FALSE(res.okay());
}

TEST_CASE("Search a PATH string for a program") {
    auto sh = cubuild::find_executable("sh", "/nonexistent-dir:/usr/bin:/bin");
    REQUIRE(sh.has_value());
    CHECK(sh->filename() == "sh");
    CHECK_FALSE(cubuild::find_executable("cubuild-no-such-program-exists", "/usr/bin:/bin"));
    CHECK_FALSE(cubuild::find_executable("sh", ""));
    CHECK(cubuild::find_executable("/bin/sh", ""));
}

TEST_CASE("Running subprocesses does not leak file descriptors") {
    auto before = count_open_fds();
    for (int i = 0; i < 8; ++i) {
        CHECK(cubuild::run_proc({"sh", "-c", "echo out"}).okay());
        CHECK_FALSE(cubuild::run_proc({"cubuild-no-such-program-exists"}).okay());
        CHECK_FALSE(cubuild::run_proc(cubuild::proc_options{
                                          .command = {"sh", "-c", "true"},
                                          .cwd     = "/cubuild-no-such-directory",
                                      })
                        .okay());
    }
    CHECK(count_open_fds() == before);
}
