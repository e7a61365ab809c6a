#pragma once

#include <string>
#include <string_view>

namespace cubuild {

/**
 * @brief Record a short machine-readable name for the failure that is ending this process.
 *
 * If CUBUILD_WRITE_ERROR_MARKER is set, the marker is written to the file it names.
 */
void write_error_marker(std::string_view) noexcept;

}  // namespace cubuild
