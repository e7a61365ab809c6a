#pragma once

#include <cubuild/util/fs/path.hpp>

#include <string>
#include <vector>

namespace cubuild {

struct build_config;

/**
 * @brief The shared libraries ('*.so*') that are directly within `lib_dir`, sorted by name.
 *
 * A missing directory yields an empty list.
 */
std::vector<fs::path> find_shared_libraries(path_ref lib_dir) noexcept;

/**
 * @brief The names of the test executables for the summary.
 *
 * If the configuration names the test binaries, those are returned as-is. Otherwise, the
 * executable files in the tests directory are listed, sorted by name.
 */
std::vector<std::string> find_test_binaries(const build_config& cfg) noexcept;

/**
 * @brief Log where the build placed its outputs, and how to run the tests
 */
void report_build_summary(const build_config& cfg) noexcept;

}  // namespace cubuild
