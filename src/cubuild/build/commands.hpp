#pragma once

#include <cubuild/util/fs/path.hpp>

#include <string>
#include <vector>

namespace cubuild {

struct build_config;

/**
 * @brief The generator command that configures the project in the build directory.
 *
 * The command must be run with the build directory as its working directory.
 */
std::vector<std::string> configure_command(const build_config& cfg, path_ref generator);

/**
 * @brief The build-driver command that compiles a configured build directory
 */
std::vector<std::string> compile_command(const build_config& cfg, path_ref generator);

/**
 * @brief The command that installs a compiled build directory into the install prefix
 */
std::vector<std::string> install_command(const build_config& cfg, path_ref generator);

}  // namespace cubuild
