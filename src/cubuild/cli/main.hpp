#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace cubuild {

class process_runner;

namespace cli {

struct options;

/**
 * @brief The complete cubuild program: Parse the command line, then load the configuration and
 * run the build.
 *
 * @param program_name The name of the program, for usage text
 * @param argv The command-line arguments, not including the program name
 * @param runner Executes the external tools
 * @return The process exit code
 */
int main_fn(std::string_view                program_name,
            const std::vector<std::string>& argv,
            process_runner&                 runner);

/**
 * @brief Resolve the configuration for the given options and run the build pipeline
 */
int run_build(const options& opts, process_runner& runner) noexcept;

}  // namespace cli
}  // namespace cubuild
