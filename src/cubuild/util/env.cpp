#include "./env.hpp"

#include <cstdlib>

std::optional<std::string> cubuild::getenv(std::string_view name) noexcept {
    const char* value = std::getenv(std::string(name).c_str());
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}
