#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace cubuild {

/// The file that could not be read or written
struct e_file_path {
    std::filesystem::path value;
};

/**
 * @brief Read the whole content of a file.
 *
 * On failure, throws std::system_error with an e_file_path and the errno attached.
 */
[[nodiscard]] std::string read_file(std::filesystem::path const& path);

/// Replace the content of a file, creating it if it does not exist
void write_file(std::filesystem::path const& path, std::string_view content);

}  // namespace cubuild
