#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace cubuild {

/// The environment variables that cubuild reads
namespace env_vars {

/// The default number of parallel compile jobs
inline constexpr std::string_view jobs = "CUBUILD_JOBS";
/// The CUDA compiler, as understood by CMake
inline constexpr std::string_view cuda_compiler = "CUDACXX";
/// A file that receives the marker of the failure that ended the run
inline constexpr std::string_view error_marker = "CUBUILD_WRITE_ERROR_MARKER";
/// The directories searched for programs
inline constexpr std::string_view search_path = "PATH";

}  // namespace env_vars

/**
 * @brief Get the value of an environment variable.
 *
 * A variable that is set to an empty string is treated as unset, the same as `${VAR:-default}` in
 * a shell script.
 */
std::optional<std::string> getenv(std::string_view name) noexcept;

}  // namespace cubuild
