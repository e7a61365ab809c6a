#include "./commands.hpp"

#include "./config.hpp"

#include <neo/ufmt.hpp>

using namespace cubuild;

std::vector<std::string> cubuild::configure_command(const build_config& cfg, path_ref generator) {
    std::vector<std::string> cmd = {
        generator.string(),
        cfg.source_dir.string(),
        neo::ufmt("-DCMAKE_BUILD_TYPE={}", cmake_build_type_name(cfg.build_type)),
        neo::ufmt("-DCMAKE_CUDA_ARCHITECTURES={}", cfg.cuda_archs.to_cmake_string()),
        neo::ufmt("-DCMAKE_POLICY_VERSION_MINIMUM={}", cfg.policy_version_minimum),
        neo::ufmt("-DCMAKE_INSTALL_PREFIX={}", cfg.install_prefix.string()),
    };
    for (auto& [key, value] : cfg.definitions) {
        cmd.push_back(neo::ufmt("-D{}={}", key, value));
    }
    cmd.push_back("-Wno-dev");
    return cmd;
}

std::vector<std::string> cubuild::compile_command(const build_config& cfg, path_ref generator) {
    return {
        generator.string(),
        "--build",
        ".",
        "--parallel",
        std::to_string(cfg.jobs),
    };
}

std::vector<std::string> cubuild::install_command(const build_config& cfg, path_ref generator) {
    return {
        generator.string(),
        "--install",
        ".",
        "--prefix",
        cfg.install_prefix.string(),
    };
}
