/// @file outcome.cpp
/// @brief Outcome classification and verdict

#include <pipeforge/publish/outcome.hpp>

#include <algorithm>

namespace pipeforge_publish {

const char* outcome_name(Outcome outcome) noexcept {
    switch (outcome) {
        case Outcome::ValidationFailed: return "validation_failed";
        case Outcome::Created: return "created";
        case Outcome::Unchanged: return "unchanged";
        case Outcome::Changed: return "changed";
        case Outcome::PublishError: return "publish_error";
        default: return "unknown";
    }
}

Outcome classify(const std::optional<Fingerprint>& before,
                 const std::optional<Fingerprint>& after) noexcept {
    if (!before) {
        return Outcome::Created;
    }
    return before == after ? Outcome::Unchanged : Outcome::Changed;
}

bool RunResult::has_drift() const noexcept {
    return std::any_of(definitions.begin(), definitions.end(), [](const DefinitionReport& report) {
        return report.outcome == Outcome::Created || report.outcome == Outcome::Changed;
    });
}

bool RunResult::success() const noexcept {
    if (fatal) {
        return false;
    }
    return !(fail_if_changed && has_drift());
}

std::size_t RunResult::count(Outcome outcome) const noexcept {
    return static_cast<std::size_t>(std::count_if(definitions.begin(), definitions.end(),
        [outcome](const DefinitionReport& report) { return report.outcome == outcome; }));
}

} // namespace pipeforge_publish
