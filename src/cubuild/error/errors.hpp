#pragma once

#include <string>
#include <string_view>

namespace cubuild {

/**
 * @brief Classes of failure that end a cubuild invocation.
 *
 * Every error raised by the build pipeline carries exactly one of these.
 */
enum class errc {
    none = 0,
    invalid_configuration,
    invalid_project_file,
    missing_tool,
    filesystem_failure,
    configure_failure,
    compile_failure,
    install_failure,
};

std::string      error_reference_of(errc) noexcept;
std::string_view explanation_of(errc) noexcept;
std::string_view default_error_string(errc) noexcept;
std::string_view error_marker_of(errc) noexcept;

/**
 * @brief A human-readable one-line description of a failure.
 */
struct e_human_message {
    std::string value;
};

}  // namespace cubuild
