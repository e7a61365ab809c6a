#include "./summary.hpp"

#include "./config.hpp"

#include <cubuild/util/log.hpp>
#include <cubuild/util/string.hpp>

#include <algorithm>

using namespace cubuild;

namespace {

bool is_executable(const fs::directory_entry& entry) {
    std::error_code ec;
    if (!entry.is_regular_file(ec)) {
        return false;
    }
    auto perms = entry.status(ec).permissions();
    return !ec && (perms & fs::perms::owner_exec) != fs::perms::none;
}

template <typename Pred>
std::vector<fs::path> list_dir(path_ref dir, Pred&& pred) noexcept {
    std::vector<fs::path> ret;
    std::error_code       ec;
    for (auto it = fs::directory_iterator{dir, ec}; !ec && it != fs::directory_iterator{};
         it.increment(ec)) {
        if (pred(*it)) {
            ret.push_back(it->path());
        }
    }
    if (ec && ec != std::errc::no_such_file_or_directory) {
        cubuild_log(debug, "Error while listing directory [{}]: {}", dir.string(), ec.message());
    }
    std::ranges::sort(ret);
    return ret;
}

}  // namespace

std::vector<fs::path> cubuild::find_shared_libraries(path_ref lib_dir) noexcept {
    return list_dir(lib_dir, [](const fs::directory_entry& entry) {
        return contains(entry.path().filename().string(), ".so");
    });
}

std::vector<std::string> cubuild::find_test_binaries(const build_config& cfg) noexcept {
    if (cfg.summary.test_binaries) {
        return *cfg.summary.test_binaries;
    }
    std::vector<std::string> names;
    for (auto& p : list_dir(cfg.build_dir / cfg.summary.tests_dir, is_executable)) {
        names.push_back(p.filename().string());
    }
    return names;
}

void cubuild::report_build_summary(const build_config& cfg) noexcept {
    auto lib_dir      = cfg.build_dir / cfg.summary.library_dir;
    auto examples_dir = cfg.build_dir / cfg.summary.examples_dir;
    auto tests_dir    = cfg.build_dir / cfg.summary.tests_dir;

    cubuild_log(info, "Libraries built in: {}/", lib_dir.string());
    for (auto& lib : find_shared_libraries(lib_dir)) {
        std::error_code ec;
        auto            size = fs::file_size(lib, ec);
        if (ec) {
            cubuild_log(info, "  {}", lib.filename().string());
        } else {
            cubuild_log(info, "  {} ({} bytes)", lib.filename().string(), size);
        }
    }
    cubuild_log(info, "Examples built in:  {}/", examples_dir.string());
    cubuild_log(info, "Unit tests in:      {}/", tests_dir.string());

    auto tests = find_test_binaries(cfg);
    if (tests.empty()) {
        return;
    }
    cubuild_log(info, "To run unit tests:");
    for (auto& name : tests) {
        cubuild_log(info,
                    "  cd {} && ./{}",
                    cfg.build_dir.string(),
                    (cfg.summary.tests_dir / name).string());
    }
}
