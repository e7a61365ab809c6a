#pragma once

#include <cubuild/error/result_fwd.hpp>
#include <cubuild/toolchain/tools.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cubuild {

struct build_config;
class process_runner;

/**
 * @brief The progress of a build. Transitions only move forward.
 *
 * `start` is the state of an invocation before its command line has been parsed. A
 * build_pipeline is only constructed from a parsed and validated build_config, so a pipeline is
 * never observed in `start`: it begins at `args_parsed`.
 */
enum class build_stage {
    start,
    args_parsed,
    toolchain_verified,
    directory_prepared,
    configured,
    compiled,
    installed,
    done,
    failed,
};

std::string_view stage_name(build_stage) noexcept;

/// The command line of an external tool that failed
struct e_command {
    std::string value;
};

/// How an external tool exited
struct e_exit_status {
    int retc   = 0;
    int signal = 0;
};

/// The combined output of an external tool that failed
struct e_tool_output {
    std::string value;
};

/**
 * @brief Drives one build through its stages: Verify the toolchain, prepare the build directory,
 * configure, compile, and optionally install.
 *
 * Each step must be called in order. If a step fails, the pipeline enters the `failed` stage and
 * no further steps may be taken.
 */
class build_pipeline {
    const build_config&          _config;
    process_runner&              _runner;
    // See build_stage::start
    build_stage                  _stage = build_stage::args_parsed;
    std::optional<located_tools> _tools;

    void _expect_stage(build_stage expected, std::string_view step) const noexcept;

    template <typename Fn>
    result<void> _step(build_stage expected, build_stage next, std::string_view step, Fn&& fn);

    result<void> _run_tool(std::vector<std::string> command, std::string_view what);

    result<void> _prepare_build_directory();

public:
    /// The config and runner must outlive the pipeline
    build_pipeline(const build_config& cfg, process_runner& runner) noexcept
        : _config(cfg)
        , _runner(runner) {}

    build_stage stage() const noexcept { return _stage; }

    /// Log the settings of this build
    void log_banner() const noexcept;

    /**
     * @brief Check that the generator and the CUDA compiler are available, then log their
     * versions. Does not touch the filesystem.
     */
    [[nodiscard]] result<void> preflight_toolchain();

    /**
     * @brief Remove the build directory if a clean build was requested, then create it if
     * needed.
     */
    [[nodiscard]] result<void> prepare_build_directory();

    /// Run the generator to configure the build directory
    [[nodiscard]] result<void> configure();

    /// Run the build driver with the configured number of jobs
    [[nodiscard]] result<void> compile();

    /// Install the compiled project. Only valid if the configuration requests an install.
    [[nodiscard]] result<void> install();

    /// Mark the pipeline as complete
    void finish() noexcept;

    /// Log the locations of the build outputs. Only valid after finish().
    void report_summary() const noexcept;

    /**
     * @brief Execute every step in order, stopping at the first failure.
     */
    [[nodiscard]] result<void> run();
};

}  // namespace cubuild
