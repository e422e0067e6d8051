#pragma once

/// @file outcome.hpp
/// @brief Per-definition outcomes and the run verdict

#include "fingerprint.hpp"

#include <pipeforge/core/error.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace pipeforge_publish {

/// Terminal state of one definition in one run
enum class Outcome : std::uint8_t {
    ValidationFailed,
    Created,
    Unchanged,
    Changed,
    PublishError,
};

[[nodiscard]] const char* outcome_name(Outcome outcome) noexcept;

/// Classify a publish from the fingerprints taken around it
///
/// Absent before means the definition had never been published.
[[nodiscard]] Outcome classify(const std::optional<Fingerprint>& before,
                               const std::optional<Fingerprint>& after) noexcept;

/// Result of one definition
struct DefinitionReport {
    std::string name;
    std::string type_name;
    std::filesystem::path path;   ///< Empty if the path could not be resolved
    Outcome outcome = Outcome::PublishError;
    std::string message;          ///< Failure detail, empty on success
};

/// Aggregate result of a run
struct RunResult {
    std::vector<DefinitionReport> definitions;
    bool fail_if_changed = false;

    /// Set when the run stopped before or during discovery
    std::optional<pipeforge_core::Error> fatal;

    /// Overall verdict
    ///
    /// Fails on a fatal error, or when fail_if_changed is set and any
    /// definition was Created or Changed. Per-definition validation and
    /// publish errors are reported but do not fail the run.
    [[nodiscard]] bool success() const noexcept;

    /// True if any definition was Created or Changed
    [[nodiscard]] bool has_drift() const noexcept;

    [[nodiscard]] std::size_t count(Outcome outcome) const noexcept;
};

} // namespace pipeforge_publish
