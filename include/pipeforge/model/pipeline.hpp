#pragma once

/// @file pipeline.hpp
/// @brief In-memory pipeline model
///
/// Plain records describing one pipeline. They carry no behaviour beyond
/// a few builders; validation lives in pipeforge_definition and rendering
/// in pipeforge_yaml.

#include "bash_task.hpp"

#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace pipeforge_model {

using EnvVar = std::pair<std::string, std::string>;
using Variable = std::pair<std::string, std::string>;

// =============================================================================
// Step
// =============================================================================

/// One step of a job
struct Step {
    std::variant<InlineBashTask, BashFileTask> task;

    std::string display_name;
    std::string name;
    std::string condition;
    bool continue_on_error = false;
    bool enabled = true;
    std::optional<int> timeout_in_minutes;
    std::vector<EnvVar> env;

    [[nodiscard]] bool is_inline() const noexcept {
        return std::holds_alternative<InlineBashTask>(task);
    }

    /// Shell options of whichever payload the step holds
    [[nodiscard]] const BashTask& shell() const {
        return std::visit([](const auto& t) -> const BashTask& { return t; }, task);
    }

    [[nodiscard]] BashTask& shell() {
        return std::visit([](auto& t) -> BashTask& { return t; }, task);
    }
};

/// Inline script step
[[nodiscard]] inline Step bash(std::initializer_list<std::string> lines, std::string display_name = {}) {
    Step step;
    step.task = InlineBashTask(lines);
    step.display_name = std::move(display_name);
    return step;
}

/// Script file step
[[nodiscard]] inline Step bash_file(std::string path, std::optional<std::string> arguments = std::nullopt,
                                    std::string display_name = {}) {
    Step step;
    step.task = BashFileTask(std::move(path), std::move(arguments));
    step.display_name = std::move(display_name);
    return step;
}

// =============================================================================
// Job / Pipeline
// =============================================================================

struct Job {
    std::string name;
    std::string display_name;
    std::string pool_image;
    std::vector<std::string> depends_on;
    std::vector<Step> steps;
};

struct Pipeline {
    std::string name;                          ///< Run number format, omitted when empty
    std::vector<std::string> trigger_branches; ///< Empty means "trigger: none"
    std::vector<std::string> pr_branches;
    std::vector<Variable> variables;
    std::vector<Job> jobs;
};

} // namespace pipeforge_model
