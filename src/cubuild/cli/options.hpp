#pragma once

#include <cubuild/util/log.hpp>
#include <debate/argument_parser.hpp>

#include <filesystem>
#include <optional>
#include <string>

namespace cubuild {

namespace fs = std::filesystem;

namespace cli {

/**
 * @brief Complete aggregate of all cubuild command-line options
 *
 * Options that are not given on the command line are left empty here. Defaults from the
 * environment and the project settings are applied by build_config::from_options().
 */
struct options {
    using path       = fs::path;
    using opt_path   = std::optional<fs::path>;
    using string     = std::string;
    using opt_string = std::optional<std::string>;

    // The `--log-level` argument
    log::level log_level = log::level::info;

    // `--clean`: Remove the build directory first
    bool clean = false;
    // `--debug`: Build with the Debug configuration
    bool debug = false;
    // `--install`: Install after building
    bool install = false;

    // `--jobs`/`-j`
    std::optional<int> jobs;
    // `--prefix`
    opt_path prefix;
    // `--cuda-archs`
    opt_string cuda_archs;

    // `--source-dir`/`-S`. If not given, uses the current working directory
    opt_path source_dir;
    // `--build-dir`/`-B`
    opt_path build_dir;
    // `--config`: An explicit project settings file
    opt_path config_file;

    // Obtain the absolute path to the project root
    path absolute_source_dir() const noexcept;

    /**
     * @brief Attach arguments to the given argument parser, binding those arguments to the values
     * in this object.
     */
    void setup_parser(debate::argument_parser& parser) noexcept;
};

}  // namespace cli
}  // namespace cubuild
