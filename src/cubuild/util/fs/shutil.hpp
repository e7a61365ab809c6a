#pragma once

#include "./path.hpp"

#include <cubuild/error/result_fwd.hpp>

namespace cubuild::inline file_utils {

/// A file or directory that could not be removed
struct e_remove_file {
    fs::path value;
};

/// A directory that could not be created
struct e_create_directory {
    fs::path value;
};

/**
 * @brief Remove the named file, or the named directory and everything within it.
 *
 * A path that does not exist is not an error. A symlink is removed, never its target.
 */
[[nodiscard]] result<void> ensure_absent(path_ref path) noexcept;

/**
 * @brief Ensure that the named directory exists, creating it and its parents if needed.
 *
 * An existing directory is not an error. An existing non-directory file is.
 */
[[nodiscard]] result<void> ensure_directory(path_ref path) noexcept;

}  // namespace cubuild::inline file_utils
