#pragma once

#include "./arch_list.hpp"

#include <cubuild/util/fs/path.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cubuild {

namespace cli {
struct options;
}  // namespace cli

struct project_settings;

enum class build_type {
    release,
    debug,
};

/// The spelling of the build type for CMAKE_BUILD_TYPE
std::string_view cmake_build_type_name(build_type) noexcept;

/// The number of processors on this machine, or four if that cannot be determined
int detected_processor_count() noexcept;

/**
 * @brief Names (or paths) of the external programs that the build requires
 */
struct tool_names {
    std::string generator     = "cmake";
    std::string cuda_compiler = "nvcc";
};

/**
 * @brief Where the build is expected to place its outputs, relative to the build directory.
 * These are only used to print the summary after a successful build.
 */
struct summary_layout {
    fs::path library_dir  = "lib";
    fs::path examples_dir = "bin/examples";
    fs::path tests_dir    = "unittest";
    /// If not set, the executables that appear in tests_dir are listed instead
    std::optional<std::vector<std::string>> test_binaries;
};

/**
 * @brief The complete, validated description of one build.
 *
 * Constructed once, then passed by const-reference to every pipeline step.
 */
struct build_config {
    cubuild::build_type build_type = build_type::release;

    /// The number of parallel jobs for the compile step. Always at least one.
    int jobs = 1;
    /// Remove the build directory before configuring
    bool clean = false;
    /// Run the install step after a successful compile
    bool do_install = false;
    /// The installation prefix. Never empty if do_install is set.
    fs::path install_prefix = "/usr/local";

    cuda_arch_list cuda_archs = cuda_arch_list::default_archs();

    /// Absolute path to the project root, handed to the generator
    fs::path source_dir;
    /// Absolute path to the build directory
    fs::path build_dir;

    /// Passed as CMAKE_POLICY_VERSION_MINIMUM
    std::string policy_version_minimum = "3.5";

    /// Additional cache definitions, in order
    std::vector<std::pair<std::string, std::string>> definitions;

    tool_names     tools;
    summary_layout summary;

    /**
     * @brief Resolve a configuration from the command line, the environment, and the project
     * settings, in that order of precedence.
     *
     * @throws (via leaf) errc::invalid_configuration with an e_human_message if the result would
     * violate one of the invariants.
     */
    static build_config from_options(const cli::options& opts, const project_settings& proj);

    /**
     * @brief Check the invariants of this configuration.
     *
     * @throws (via leaf) errc::invalid_configuration with an e_human_message on failure.
     */
    void validate() const;
};

}  // namespace cubuild
