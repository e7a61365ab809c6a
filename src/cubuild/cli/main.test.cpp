#include "./main.hpp"

#include <cubuild/cubuild.test.hpp>
#include <cubuild/util/fs/io.hpp>
#include <cubuild/util/log.hpp>
#include <cubuild/util/signal.hpp>

#include <cstdlib>

using namespace cubuild;

namespace {

struct cli_fixture {
    testing::scratch_dir         tmp = testing::scratch_dir::create();
    testing::fake_process_runner runner;
    fs::path                     source_dir = tmp.path() / "project";
    fs::path                     build_dir  = source_dir / "build";
    fs::path                     marker     = tmp.path() / "error-marker.txt";

    cli_fixture() {
        ::unsetenv("CUBUILD_JOBS");
        ::unsetenv("CUDACXX");
        ::setenv("CUBUILD_WRITE_ERROR_MARKER", marker.c_str(), 1);
        fs::create_directories(source_dir);
        write_file(source_dir / "CMakeLists.txt", "project(fake)\n");
    }

    ~cli_fixture() {
        ::unsetenv("CUBUILD_WRITE_ERROR_MARKER");
        reset_cancelled();
        log::current_log_level = log::level::info;
    }

    int run(std::vector<std::string> args) {
        args.insert(args.begin(), {"--source-dir", source_dir.string()});
        return cli::main_fn("cubuild", args, runner);
    }

    std::string marker_content() const {
        if (!fs::exists(marker)) {
            return "<no marker>";
        }
        return read_file(marker);
    }
};

}  // namespace

TEST_CASE_METHOD(cli_fixture, "Help exits immediately") {
    auto flag = GENERATE(as<std::string>{}, "--help", "-h");
    CHECK(run({"--jobs", "4", flag}) == 0);
    CHECK(runner.lookups.empty());
    CHECK(runner.commands.empty());
    CHECK_FALSE(fs::exists(build_dir));
}

TEST_CASE_METHOD(cli_fixture, "Unknown options are rejected before anything happens") {
    auto args = GENERATE(values<std::vector<std::string>>({
        {"--jbos", "4"},
        {"--frobnicate"},
        {"build"},
        {"--jobs", "many"},
        {"--jobs"},
        {"--clean=yes"},
        {"--clean", "--clean"},
        {"--log-level", "loud"},
    }));
    CHECK(run(args) == 2);
    CHECK(runner.lookups.empty());
    CHECK(runner.commands.empty());
    CHECK_FALSE(fs::exists(build_dir));
}

TEST_CASE_METHOD(cli_fixture, "Build with an explicit job count") {
    CHECK(run({"--jobs", "8"}) == 0);
    CHECK(fs::is_directory(build_dir));
    CHECK(runner.count_runs_with("-DCMAKE_BUILD_TYPE=Release") == 1);
    CHECK(runner.count_runs_with("--build") == 1);
    CHECK(runner.count_runs_with("--install") == 0);
    auto& compile = runner.commands.back();
    CHECK(compile.command.back() == "8");
    CHECK(marker_content() == "<no marker>");
}

TEST_CASE_METHOD(cli_fixture, "The job count may be attached to the option") {
    CHECK(run({"--jobs=3"}) == 0);
    CHECK(runner.commands.back().command.back() == "3");
    CHECK(run({"-j", "5"}) == 0);
    CHECK(runner.commands.back().command.back() == "5");
}

TEST_CASE_METHOD(cli_fixture, "The log level is given by name") {
    auto level = GENERATE(as<std::string>{}, "trace", "warn", "silent");
    CHECK(run({"--log-level", level}) == 0);
    CHECK(runner.count_runs_with("--build") == 1);
}

TEST_CASE_METHOD(cli_fixture, "Clean debug build with installation") {
    fs::create_directories(build_dir);
    write_file(build_dir / "stale.txt", "old");
    CHECK(run({"--clean", "--debug", "--install", "--prefix", "/opt/lib"}) == 0);
    CHECK_FALSE(fs::exists(build_dir / "stale.txt"));
    CHECK(runner.count_runs_with("-DCMAKE_BUILD_TYPE=Debug") == 1);
    CHECK(runner.count_runs_with("-DCMAKE_INSTALL_PREFIX=/opt/lib") == 1);
    CHECK(runner.commands.back().command
          == std::vector<std::string>{"/usr/bin/cmake", "--install", ".", "--prefix", "/opt/lib"});
}

TEST_CASE_METHOD(cli_fixture, "A missing CUDA compiler fails without creating the build directory") {
    runner.programs.erase("nvcc");
    CHECK(run({}) == 1);
    CHECK_FALSE(fs::exists(build_dir));
    CHECK(runner.commands.empty());
    CHECK(marker_content() == "missing-tool");
}

TEST_CASE_METHOD(cli_fixture, "A failed preflight leaves an existing build directory alone") {
    fs::create_directories(build_dir);
    write_file(build_dir / "CMakeCache.txt", "# cache\n");
    runner.programs.erase("nvcc");
    CHECK(run({"--clean"}) == 1);
    CHECK(fs::exists(build_dir / "CMakeCache.txt"));
    CHECK(runner.commands.empty());
    CHECK(marker_content() == "missing-tool");
}

TEST_CASE_METHOD(cli_fixture, "A failed configure stops the build") {
    runner.fail_when("-Wno-dev", 1);
    CHECK(run({}) == 1);
    CHECK(runner.count_runs_with("--build") == 0);
    CHECK(marker_content() == "configure-failed");
}

TEST_CASE_METHOD(cli_fixture, "A failed install is reported") {
    runner.fail_when("--install", 1);
    CHECK(run({"--install"}) == 1);
    CHECK(marker_content() == "install-failed");
}

TEST_CASE_METHOD(cli_fixture, "Invalid configurations are rejected") {
    auto args = GENERATE(values<std::vector<std::string>>({
        {"--jobs", "0"},
        {"--cuda-archs", "sm_80"},
        {"--install", "--prefix", ""},
    }));
    CHECK(run(args) == 2);
    CHECK(runner.lookups.empty());
    CHECK_FALSE(fs::exists(build_dir));
    CHECK(marker_content() == "invalid-configuration");
}

TEST_CASE_METHOD(cli_fixture, "Settings come from the project file") {
    write_file(source_dir / "cubuild.yaml", R"(
build-dir: out
cuda-architectures: [80, 90]
definitions:
  WITH_OPENMP: "OFF"
)");
    CHECK(run({}) == 0);
    CHECK(fs::is_directory(source_dir / "out"));
    CHECK_FALSE(fs::exists(build_dir));
    CHECK(runner.count_runs_with("-DCMAKE_CUDA_ARCHITECTURES=80;90") == 1);
    CHECK(runner.count_runs_with("-DWITH_OPENMP=OFF") == 1);
}

TEST_CASE_METHOD(cli_fixture, "A bad project file is reported") {
    write_file(source_dir / "cubuild.yaml", "bulid-dir: out\n");
    CHECK(run({}) == 1);
    CHECK(runner.lookups.empty());
    CHECK(marker_content() == "invalid-project-file");
}

TEST_CASE_METHOD(cli_fixture, "A missing explicit project file is reported") {
    CHECK(run({"--config", (tmp.path() / "nope.yaml").string()}) == 1);
    CHECK(marker_content() == "invalid-project-file");
}

TEST_CASE_METHOD(cli_fixture, "Cancellation ends the build") {
    notify_cancel();
    CHECK(run({}) == 2);
    // No step runs after the cancellation is noticed
    CHECK(runner.count_runs_with("--build") == 0);
}

TEST_CASE_METHOD(cli_fixture, "Cancellation during the tool lookup prepares nothing") {
    fs::create_directories(build_dir);
    write_file(build_dir / "CMakeCache.txt", "# cache\n");
    runner.on_lookup = [](std::string_view name) {
        if (name == "nvcc") {
            notify_cancel();
        }
    };
    CHECK(run({"--clean"}) == 2);
    CHECK(fs::exists(build_dir / "CMakeCache.txt"));
    CHECK(runner.count_runs_with("-Wno-dev") == 0);
    CHECK(runner.count_runs_with("--build") == 0);
}
