#pragma once

/// @file fingerprint.hpp
/// @brief Byte-level content fingerprints for drift detection

#include <array>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace pipeforge_publish {

/// MD5 digest of a file's bytes
///
/// Compares raw bytes only. Two files that differ only in formatting have
/// different fingerprints.
struct Fingerprint {
    static constexpr std::size_t SIZE = 16;

    std::array<std::uint8_t, SIZE> bytes{};

    /// Lowercase hex rendering
    [[nodiscard]] std::string to_hex() const;

    bool operator==(const Fingerprint& other) const = default;
};

/// Fingerprint the file at path
///
/// Never fails: a missing file gives std::nullopt, which always means
/// "never published". A file that exists but cannot be read is logged and
/// also reported as absent.
[[nodiscard]] std::optional<Fingerprint> fingerprint_file(const std::filesystem::path& path);

/// Fingerprint an in-memory buffer
[[nodiscard]] Fingerprint fingerprint_bytes(std::string_view data);

} // namespace pipeforge_publish
