#include "./path.hpp"

#include <algorithm>

using namespace cubuild;

fs::path cubuild::normalize_path(path_ref p_) noexcept {
    auto p = p_.lexically_normal();
    while (!p.empty() && p.filename().empty()) {
        auto parent = p.parent_path();
        if (parent == p) {
            // A root path ('/') is its own parent. Stop here.
            break;
        }
        p = parent;
    }
    return fs::path(p.generic_string());
}

fs::path cubuild::resolve_path_weak(path_ref p) noexcept {
    std::error_code ec;
    auto            abs = fs::weakly_canonical(p, ec);
    if (ec) {
        abs = fs::absolute(p, ec);
        if (ec) {
            return normalize_path(p);
        }
    }
    return normalize_path(abs);
}

bool cubuild::path_contains(path_ref parent_, path_ref child_) noexcept {
    auto parent = resolve_path_weak(parent_);
    auto child  = resolve_path_weak(child_);
    auto [pit, cit]
        = std::mismatch(parent.begin(), parent.end(), child.begin(), child.end());
    return pit == parent.end();
}
