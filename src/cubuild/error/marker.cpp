#include "./marker.hpp"

#include <cubuild/util/env.hpp>
#include <cubuild/util/fs/io.hpp>
#include <cubuild/util/log.hpp>

#include <exception>

void cubuild::write_error_marker(std::string_view error) noexcept {
    cubuild_log(trace, "[error marker {}]", error);
    auto efile_path = cubuild::getenv(env_vars::error_marker);
    if (!efile_path) {
        return;
    }
    cubuild_log(trace, "[error marker written to [{}]]", *efile_path);
    try {
        cubuild::write_file(*efile_path, error);
    } catch (const std::exception& e) {
        cubuild_log(warn, "Failed to write error marker to [{}]: {}", *efile_path, e.what());
    }
}
