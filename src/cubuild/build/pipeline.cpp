#include "./pipeline.hpp"

#include "./commands.hpp"
#include "./config.hpp"
#include "./summary.hpp"

#include <cubuild/error/errors.hpp>
#include <cubuild/error/result.hpp>
#include <cubuild/util/fs/shutil.hpp>
#include <cubuild/util/log.hpp>
#include <cubuild/util/proc.hpp>
#include <cubuild/util/signal.hpp>

#include <neo/assert.hpp>
#include <neo/ufmt.hpp>

using namespace cubuild;

std::string_view cubuild::stage_name(build_stage s) noexcept {
    switch (s) {
    case build_stage::start:
        return "start";
    case build_stage::args_parsed:
        return "args-parsed";
    case build_stage::toolchain_verified:
        return "toolchain-verified";
    case build_stage::directory_prepared:
        return "directory-prepared";
    case build_stage::configured:
        return "configured";
    case build_stage::compiled:
        return "compiled";
    case build_stage::installed:
        return "installed";
    case build_stage::done:
        return "done";
    case build_stage::failed:
        return "failed";
    }
    neo_assert_always(invariant, false, "Invalid build stage", int(s));
    std::terminate();
}

void build_pipeline::_expect_stage(build_stage expected, std::string_view step) const noexcept {
    neo_assert(expects,
               _stage == expected,
               "Build pipeline step was invoked out of order",
               step,
               stage_name(expected),
               stage_name(_stage));
}

template <typename Fn>
result<void> build_pipeline::_step(build_stage      expected,
                                   build_stage      next,
                                   std::string_view step,
                                   Fn&&             fn) {
    _expect_stage(expected, step);
    // Failures via exception (e.g. cancellation) also end the pipeline
    try {
        // A ^C that arrived between steps must not start another one
        cancellation_point();
        result<void> res = fn();
        _stage           = res ? next : build_stage::failed;
        return res;
    } catch (...) {
        _stage = build_stage::failed;
        throw;
    }
}

result<void> build_pipeline::_run_tool(std::vector<std::string> command, std::string_view what) {
    auto cmd_str = quote_command(command);
    cubuild_log(debug, "Executing command: {}", cmd_str);
    auto res = _runner.run(proc_options{
        .command     = std::move(command),
        .cwd         = _config.build_dir,
        .echo_output = true,
    });
    cancellation_point();
    if (!res.okay()) {
        std::string message;
        if (res.signal) {
            message = neo::ufmt("{} was terminated by signal {}", what, res.signal);
        } else {
            message = neo::ufmt("{} failed [Exited {}]", what, res.retc);
        }
        return new_error(e_human_message{std::move(message)},
                         e_command{std::move(cmd_str)},
                         e_exit_status{.retc = res.retc, .signal = res.signal},
                         e_tool_output{std::move(res.output)});
    }
    return {};
}

void build_pipeline::log_banner() const noexcept {
    cubuild_log(info, "========================================");
    cubuild_log(info, "Build type:     {}", cmake_build_type_name(_config.build_type));
    cubuild_log(info, "Build dir:      {}", _config.build_dir.string());
    cubuild_log(info, "Parallel jobs:  {}", _config.jobs);
    cubuild_log(info, "CUDA archs:     {}", _config.cuda_archs.to_cmake_string());
    if (_config.do_install) {
        cubuild_log(info, "Install prefix: {}", _config.install_prefix.string());
    }
    cubuild_log(info, "========================================");
}

result<void> build_pipeline::preflight_toolchain() {
    return _step(build_stage::args_parsed,
                 build_stage::toolchain_verified,
                 "preflight-toolchain",
                 [&]() -> result<void> {
                     BOOST_LEAF_AUTO(tools, locate_tools(_config.tools, _runner));
                     log_tool_versions(tools, _runner);
                     _tools = std::move(tools);
                     return {};
                 });
}

result<void> build_pipeline::_prepare_build_directory() {
    CUBUILD_E_SCOPE(errc::filesystem_failure);
    auto& build_dir = _config.build_dir;
    if (_config.clean) {
        if (path_contains(build_dir, _config.source_dir)) {
            return new_error(e_human_message{neo::ufmt(
                                 "Refusing to clean build directory [{}], which contains the "
                                 "project source directory",
                                 build_dir.string())},
                             e_remove_file{build_dir},
                             std::make_error_code(std::errc::operation_not_permitted));
        }
        cubuild_log(info, "Cleaning build directory [{}]", build_dir.string());
        BOOST_LEAF_CHECK(ensure_absent(build_dir));
    }
    BOOST_LEAF_CHECK(ensure_directory(build_dir));
    return {};
}

result<void> build_pipeline::prepare_build_directory() {
    return _step(build_stage::toolchain_verified,
                 build_stage::directory_prepared,
                 "prepare-build-directory",
                 [&] { return _prepare_build_directory(); });
}

result<void> build_pipeline::configure() {
    return _step(build_stage::directory_prepared,
                 build_stage::configured,
                 "configure",
                 [&]() -> result<void> {
                     CUBUILD_E_SCOPE(errc::configure_failure);
                     cubuild_log(info, "Configuring with CMake...");
                     return _run_tool(configure_command(_config, _tools->generator),
                                      "CMake configure");
                 });
}

result<void> build_pipeline::compile() {
    return _step(build_stage::configured,
                 build_stage::compiled,
                 "compile",
                 [&]() -> result<void> {
                     CUBUILD_E_SCOPE(errc::compile_failure);
                     cubuild_log(info, "Building with {} parallel jobs...", _config.jobs);
                     return _run_tool(compile_command(_config, _tools->generator), "Build");
                 });
}

result<void> build_pipeline::install() {
    neo_assert(expects,
               _config.do_install,
               "Install step invoked, but installation was not requested");
    return _step(build_stage::compiled,
                 build_stage::installed,
                 "install",
                 [&]() -> result<void> {
                     CUBUILD_E_SCOPE(errc::install_failure);
                     cubuild_log(info,
                                 "Installing to [{}]...",
                                 _config.install_prefix.string());
                     return _run_tool(install_command(_config, _tools->generator), "Install");
                 });
}

void build_pipeline::finish() noexcept {
    _expect_stage(_config.do_install ? build_stage::installed : build_stage::compiled, "finish");
    _stage = build_stage::done;
    cubuild_log(info, "========================================");
    cubuild_log(info, "Build completed successfully!");
    cubuild_log(info, "========================================");
}

void build_pipeline::report_summary() const noexcept {
    _expect_stage(build_stage::done, "report-summary");
    report_build_summary(_config);
}

result<void> build_pipeline::run() {
    log_banner();
    BOOST_LEAF_CHECK(preflight_toolchain());
    BOOST_LEAF_CHECK(prepare_build_directory());
    BOOST_LEAF_CHECK(configure());
    BOOST_LEAF_CHECK(compile());
    if (_config.do_install) {
        BOOST_LEAF_CHECK(install());
    }
    finish();
    report_summary();
    return {};
}
