#pragma once

/// @file version.hpp
/// @brief Tool version for pipeforge

#include <cstdint>
#include <string>

namespace pipeforge_core {

/// Semantic version (major.minor.patch)
struct Version {
    std::uint16_t major = 0;
    std::uint16_t minor = 0;
    std::uint16_t patch = 0;

    [[nodiscard]] std::string to_string() const {
        return std::to_string(major) + "." + std::to_string(minor) + "." + std::to_string(patch);
    }
};

/// Version of the pipeforge tool and its module API
[[nodiscard]] constexpr Version tool_version() noexcept {
    return Version{0, 3, 0};
}

} // namespace pipeforge_core
