#include "./shutil.hpp"

#include <cubuild/error/result.hpp>
#include <cubuild/util/log.hpp>

#include <system_error>

using namespace cubuild;

result<void> cubuild::ensure_absent(path_ref path) noexcept {
    CUBUILD_E_SCOPE(e_remove_file{path});
    std::error_code ec;
    auto            st = fs::symlink_status(path, ec);
    if (st.type() == fs::file_type::not_found) {
        cubuild_log(trace, "Nothing to remove at [{}]", path.string());
        return {};
    }
    if (ec) {
        return new_error(ec);
    }
    auto n_removed = fs::remove_all(path, ec);
    // Another process may have removed it in the meantime
    if (ec && ec != std::errc::no_such_file_or_directory) {
        return new_error(ec);
    }
    if (!ec) {
        cubuild_log(trace, "Removed [{}] ({} filesystem entries)", path.string(), n_removed);
    }
    return {};
}

result<void> cubuild::ensure_directory(path_ref path) noexcept {
    CUBUILD_E_SCOPE(e_create_directory{path});
    std::error_code ec;
    if (fs::create_directories(path, ec)) {
        cubuild_log(trace, "Created directory [{}]", path.string());
        return {};
    }
    if (ec) {
        return new_error(ec);
    }
    // Nothing was created: The path already exists, but it may be something other than a directory
    if (!fs::is_directory(path, ec)) {
        return new_error(ec ? ec : std::make_error_code(std::errc::not_a_directory));
    }
    return {};
}
