#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace cubuild {

/**
 * @brief An error while parsing a CUDA architecture list. Holds the offending identifier.
 */
struct e_invalid_cuda_arch {
    std::string value;
};

/**
 * @brief An ordered set of CUDA target architecture identifiers, as accepted by
 * CMAKE_CUDA_ARCHITECTURES.
 *
 * Each identifier is either one of the special values 'native', 'all', or 'all-major', or a
 * compute capability such as '86' or '90a', optionally suffixed with '-real' or '-virtual'.
 * Duplicate identifiers are collapsed, keeping the position of the first occurrence.
 */
class cuda_arch_list {
    std::vector<std::string> _archs;

public:
    cuda_arch_list() = default;

    /**
     * @brief Parse a list of identifiers separated by semicolons and/or commas.
     *
     * @throws invalid_configuration (via leaf) with e_invalid_cuda_arch if any identifier is
     * malformed, or if the list is empty.
     */
    static cuda_arch_list parse(std::string_view spec);

    /**
     * @brief Build a list from individual identifiers, with the same validation as parse()
     */
    static cuda_arch_list from_items(const std::vector<std::string>& items);

    /// The default set of architectures: Volta through Hopper
    static cuda_arch_list default_archs();

    static bool is_valid_identifier(std::string_view id) noexcept;

    /// Add an identifier to the end of the list. Returns `false` if it was already present.
    bool add(std::string_view id);

    auto&       items() const noexcept { return _archs; }
    bool        empty() const noexcept { return _archs.empty(); }
    std::size_t size() const noexcept { return _archs.size(); }

    /// Render the list for CMAKE_CUDA_ARCHITECTURES
    std::string to_cmake_string() const noexcept;

    bool operator==(const cuda_arch_list&) const noexcept = default;
};

}  // namespace cubuild
