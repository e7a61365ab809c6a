#include "./config.hpp"

#include <cubuild/cli/options.hpp>
#include <cubuild/error/errors.hpp>
#include <cubuild/project/project_file.hpp>
#include <cubuild/util/env.hpp>
#include <cubuild/util/log.hpp>
#include <cubuild/util/string.hpp>

#include <boost/leaf/exception.hpp>
#include <neo/ufmt.hpp>

#include <charconv>
#include <stdexcept>
#include <thread>

using namespace cubuild;

namespace {

[[noreturn]] void throw_invalid_config(std::string message) {
    BOOST_LEAF_THROW_EXCEPTION(std::invalid_argument(message),
                               errc::invalid_configuration,
                               e_human_message{std::move(message)});
}

int jobs_from_env() {
    auto env_jobs = cubuild::getenv(env_vars::jobs);
    if (!env_jobs) {
        return detected_processor_count();
    }
    auto str = trim_view(*env_jobs);
    int  n   = 0;
    auto res = std::from_chars(str.data(), str.data() + str.size(), n);
    if (res.ec != std::errc{} || res.ptr != str.data() + str.size()) {
        throw_invalid_config(
            neo::ufmt("CUBUILD_JOBS must be an integer, but is set to '{}'", *env_jobs));
    }
    return n;
}

}  // namespace

std::string_view cubuild::cmake_build_type_name(build_type t) noexcept {
    switch (t) {
    case build_type::release:
        return "Release";
    case build_type::debug:
        return "Debug";
    }
    return "Release";
}

int cubuild::detected_processor_count() noexcept {
    auto n = std::thread::hardware_concurrency();
    if (n == 0) {
        return 4;
    }
    return static_cast<int>(n);
}

build_config build_config::from_options(const cli::options& opts, const project_settings& proj) {
    build_config ret;

    ret.source_dir = resolve_path_weak(opts.source_dir.value_or(fs::current_path()));

    if (opts.build_dir) {
        ret.build_dir = resolve_path_weak(*opts.build_dir);
    } else if (proj.build_dir) {
        // Relative paths in the project file are relative to the project
        ret.build_dir = resolve_path_weak(ret.source_dir / *proj.build_dir);
    } else {
        ret.build_dir = ret.source_dir / "build";
    }

    if (opts.debug) {
        ret.build_type = build_type::debug;
    } else {
        ret.build_type = proj.build_type.value_or(build_type::release);
    }

    ret.jobs       = opts.jobs ? *opts.jobs : jobs_from_env();
    ret.clean      = opts.clean;
    ret.do_install = opts.install;

    if (opts.prefix) {
        ret.install_prefix = *opts.prefix;
    } else if (proj.install_prefix) {
        ret.install_prefix = *proj.install_prefix;
    }

    if (opts.cuda_archs) {
        ret.cuda_archs = cuda_arch_list::parse(*opts.cuda_archs);
    } else if (proj.cuda_archs) {
        ret.cuda_archs = *proj.cuda_archs;
    }

    if (proj.policy_version_minimum) {
        ret.policy_version_minimum = *proj.policy_version_minimum;
    }
    ret.definitions = proj.definitions;

    if (proj.generator) {
        ret.tools.generator = *proj.generator;
    }
    if (auto cudacxx = cubuild::getenv(env_vars::cuda_compiler)) {
        ret.tools.cuda_compiler = *cudacxx;
    } else if (proj.cuda_compiler) {
        ret.tools.cuda_compiler = *proj.cuda_compiler;
    }

    ret.summary = proj.summary;

    ret.validate();
    return ret;
}

void build_config::validate() const {
    if (jobs < 1) {
        throw_invalid_config(
            neo::ufmt("The number of parallel jobs must be at least one (Got {})", jobs));
    }
    if (do_install && install_prefix.empty()) {
        throw_invalid_config("An installation prefix is required when installing");
    }
    if (cuda_archs.empty()) {
        throw_invalid_config("At least one CUDA architecture must be specified");
    }
    std::error_code ec;
    if (!fs::is_directory(source_dir, ec)) {
        throw_invalid_config(
            neo::ufmt("The source directory [{}] does not exist", source_dir.string()));
    }
    if (tools.generator.empty() || tools.cuda_compiler.empty()) {
        throw_invalid_config("Tool names must not be empty");
    }
}
