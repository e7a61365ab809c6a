#include "./errors.hpp"

#include <neo/assert.hpp>

#include <exception>

using namespace cubuild;

namespace {

std::string error_url_prefix = "https://cubuild.dev/docs/err/";

std::string error_url_suffix(cubuild::errc ec) noexcept {
    switch (ec) {
    case errc::invalid_configuration:
        return "invalid-configuration.html";
    case errc::invalid_project_file:
        return "invalid-project-file.html";
    case errc::missing_tool:
        return "missing-tool.html";
    case errc::filesystem_failure:
        return "filesystem-failure.html";
    case errc::configure_failure:
        return "configure-failure.html";
    case errc::compile_failure:
        return "compile-failure.html";
    case errc::install_failure:
        return "install-failure.html";
    case errc::none:
        break;
    }
    neo_assert_always(invariant,
                      false,
                      "Unreachable code path generating error explanation URL",
                      int(ec));
    std::terminate();
}

}  // namespace

std::string cubuild::error_reference_of(cubuild::errc ec) noexcept {
    return error_url_prefix + error_url_suffix(ec);
}

std::string_view cubuild::explanation_of(cubuild::errc ec) noexcept {
    switch (ec) {
    case errc::invalid_configuration:
        return R"(
The combination of options, environment variables, and project settings does not
describe a usable build. The parallel job count must be at least one, an
installation prefix is required when installing, and the CUDA architecture list
must name at least one valid architecture.
)";
    case errc::invalid_project_file:
        return R"(
The project settings file (cubuild.yaml) could not be read or contains data that
cubuild does not understand. Check the file for YAML syntax errors and for
misspelled keys.
)";
    case errc::missing_tool:
        return R"(
cubuild needs CMake and a CUDA compiler to be available on the PATH before it
will touch the build directory. Install the missing tool, or adjust PATH (or
CUDACXX, for the CUDA compiler) so that it can be found.
)";
    case errc::filesystem_failure:
        return R"(
Preparing the build directory failed. The directory could not be removed or
created, or something other than a directory already exists at that path.
cubuild will also refuse to clean a build directory that contains the project
sources.
)";
    case errc::configure_failure:
        return R"(
CMake failed to configure the project. CMake's own diagnostics are shown above.
Nothing was compiled.
)";
    case errc::compile_failure:
        return R"(
The build driver reported a failure while compiling the project. Refer to the
compiler output above. Partially built artifacts are left in the build
directory.
)";
    case errc::install_failure:
        return R"(
The project compiled successfully, but installing it failed. Files that were
already copied into the installation prefix are not removed. A common cause is
lacking write permission to the prefix.
)";
    case errc::none:
        break;
    }
    neo_assert_always(invariant, false, "Unreachable code path in explanation_of()", int(ec));
    std::terminate();
}

std::string_view cubuild::default_error_string(cubuild::errc ec) noexcept {
    switch (ec) {
    case errc::invalid_configuration:
        return "Invalid build configuration";
    case errc::invalid_project_file:
        return "Invalid project settings file";
    case errc::missing_tool:
        return "A required tool is not installed";
    case errc::filesystem_failure:
        return "Failed to prepare the build directory";
    case errc::configure_failure:
        return "Configuring the project failed";
    case errc::compile_failure:
        return "Compiling the project failed";
    case errc::install_failure:
        return "Installing the project failed";
    case errc::none:
        break;
    }
    neo_assert_always(invariant, false, "Unreachable code path in default_error_string()", int(ec));
    std::terminate();
}

std::string_view cubuild::error_marker_of(cubuild::errc ec) noexcept {
    switch (ec) {
    case errc::invalid_configuration:
        return "invalid-configuration";
    case errc::invalid_project_file:
        return "invalid-project-file";
    case errc::missing_tool:
        return "missing-tool";
    case errc::filesystem_failure:
        return "filesystem-failure";
    case errc::configure_failure:
        return "configure-failed";
    case errc::compile_failure:
        return "compile-failed";
    case errc::install_failure:
        return "install-failed";
    case errc::none:
        break;
    }
    neo_assert_always(invariant, false, "Unreachable code path in error_marker_of()", int(ec));
    std::terminate();
}
