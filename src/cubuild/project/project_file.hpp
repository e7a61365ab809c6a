#pragma once

#include <cubuild/build/arch_list.hpp>
#include <cubuild/build/config.hpp>
#include <cubuild/util/fs/path.hpp>

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace YAML {
class Node;
}  // namespace YAML

namespace cubuild {

/**
 * @brief The path to the project settings file that was being read when an error occurred.
 */
struct e_project_file_path {
    fs::path value;
};

/**
 * @brief The YAML parser's own error message.
 */
struct e_yaml_parse_error {
    std::string value;
};

/**
 * @brief An unknown key was found in the project settings. `nearest` holds the closest known key.
 */
struct e_bad_project_key {
    std::string                given;
    std::optional<std::string> nearest;
};

/**
 * @brief Per-project defaults for the build, loaded from a 'cubuild.yaml' file.
 *
 * Every value is optional. Values from the command line and the environment take precedence.
 */
struct project_settings {
    std::optional<fs::path>       build_dir;
    std::optional<cubuild::build_type> build_type;
    std::optional<fs::path>       install_prefix;
    std::optional<cuda_arch_list> cuda_archs;
    std::optional<std::string>    policy_version_minimum;
    std::optional<std::string>    generator;
    std::optional<std::string>    cuda_compiler;

    std::vector<std::pair<std::string, std::string>> definitions;

    summary_layout summary;

    /// The name of the settings file that is loaded from the project root by default
    static constexpr std::string_view default_filename = "cubuild.yaml";

    /**
     * @brief Interpret an already-parsed YAML document.
     *
     * @throws (via leaf) errc::invalid_project_file on unknown keys or data of the wrong shape.
     */
    static project_settings from_yaml(const YAML::Node& node);

    /**
     * @brief Parse project settings from a YAML string
     */
    static project_settings from_yaml_string(std::string_view content);

    /**
     * @brief Load the given settings file. The file must exist.
     */
    static project_settings load_file(path_ref filepath);

    /**
     * @brief Load settings for a build.
     *
     * If `explicit_file` is given, it is loaded and must exist. Otherwise the default settings
     * file in `source_dir` is loaded if it exists, and empty settings are returned if not.
     */
    static project_settings load_for(path_ref source_dir, const std::optional<fs::path>& explicit_file);
};

}  // namespace cubuild
