#pragma once

#include <cubuild/error/result_fwd.hpp>
#include <cubuild/util/fs/path.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace cubuild {

struct tool_names;
class process_runner;

/**
 * @brief The name of a required program that could not be found
 */
struct e_missing_tool {
    std::string value;
};

/**
 * @brief The resolved locations of the programs used by the build
 */
struct located_tools {
    fs::path generator;
    fs::path cuda_compiler;
};

/**
 * @brief Find the generator and the CUDA compiler.
 *
 * The generator is looked up first. On failure, returns an error with errc::missing_tool and
 * e_missing_tool naming the first tool that was not found.
 */
[[nodiscard]] result<located_tools> locate_tools(const tool_names& names, process_runner& runner);

/**
 * @brief Run `<cmake> --version` and return the first line of its output
 */
std::optional<std::string> query_generator_version(path_ref cmake, process_runner& runner);

/**
 * @brief Run `<nvcc> --version` and return the line that names the release
 */
std::optional<std::string> query_cuda_version(path_ref nvcc, process_runner& runner);

/**
 * @brief Log the versions of the given tools. Failures to obtain a version are only warnings.
 */
void log_tool_versions(const located_tools& tools, process_runner& runner);

}  // namespace cubuild
