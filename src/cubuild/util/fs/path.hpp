#pragma once

#include <filesystem>

namespace cubuild {

namespace fs = std::filesystem;

/**
 * @brief Alias of a const& to a std::filesystem::path
 */
using path_ref = const fs::path&;

/**
 * @brief Convert a path to its most-normal form: No redundant dots and dot-dots, no trailing
 * directory separator, and in its generic form.
 */
[[nodiscard]] fs::path normalize_path(path_ref p) noexcept;

/**
 * @brief Obtain the normalized absolute path to a possibly-existing file or directory.
 */
[[nodiscard]] fs::path resolve_path_weak(path_ref p) noexcept;

/**
 * @brief Determine whether `parent` is `child` or one of its ancestors, after weak resolution of
 * both paths.
 */
[[nodiscard]] bool path_contains(path_ref parent, path_ref child) noexcept;

}  // namespace cubuild
