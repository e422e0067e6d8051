/// @file emitter.cpp
/// @brief YAML rendering built on yaml-cpp's emitter

#include <pipeforge/yaml/emitter.hpp>

#include <yaml-cpp/yaml.h>

#include <stdexcept>

namespace pipeforge_yaml {

using namespace pipeforge_model;

namespace {

void check(const YAML::Emitter& out) {
    if (!out.good()) {
        throw std::runtime_error("YAML emitter error: " + out.GetLastError());
    }
}

void emit_branches(YAML::Emitter& out, const std::vector<std::string>& branches) {
    out << YAML::BeginMap;
    out << YAML::Key << "branches" << YAML::Value;
    out << YAML::BeginMap;
    out << YAML::Key << "include" << YAML::Value << YAML::BeginSeq;
    for (const auto& branch : branches) {
        out << branch;
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;
    out << YAML::EndMap;
}

/// Shell options, split around env because of the field order
void emit_shell_options(YAML::Emitter& out, const BashTask& shell) {
    if (shell.working_directory) {
        out << YAML::Key << "workingDirectory" << YAML::Value << *shell.working_directory;
    }
    if (shell.fail_on_stderr) {
        out << YAML::Key << "failOnStderr" << YAML::Value << true;
    }
    if (shell.no_profile) {
        out << YAML::Key << "noProfile" << YAML::Value << true;
    }
}

} // anonymous namespace

// =============================================================================
// Steps
// =============================================================================

void emit_step(YAML::Emitter& out, const Step& step) {
    out << YAML::BeginMap;

    if (const auto* inline_task = std::get_if<InlineBashTask>(&step.task)) {
        out << YAML::Key << "bash" << YAML::Value << YAML::Literal << inline_task->contents;
    } else {
        const auto& file_task = std::get<BashFileTask>(step.task);
        out << YAML::Key << "bash" << YAML::Value << file_task.file_path;
        if (file_task.arguments) {
            out << YAML::Key << "arguments" << YAML::Value << *file_task.arguments;
        }
    }

    if (!step.display_name.empty()) {
        out << YAML::Key << "displayName" << YAML::Value << step.display_name;
    }
    if (!step.name.empty()) {
        out << YAML::Key << "name" << YAML::Value << step.name;
    }
    if (!step.condition.empty()) {
        out << YAML::Key << "condition" << YAML::Value << step.condition;
    }
    if (step.continue_on_error) {
        out << YAML::Key << "continueOnError" << YAML::Value << true;
    }
    if (!step.enabled) {
        out << YAML::Key << "enabled" << YAML::Value << false;
    }
    if (step.timeout_in_minutes) {
        out << YAML::Key << "timeoutInMinutes" << YAML::Value << *step.timeout_in_minutes;
    }

    const BashTask& shell = step.shell();
    emit_shell_options(out, shell);

    if (!step.env.empty()) {
        out << YAML::Key << "env" << YAML::Value << YAML::BeginMap;
        for (const auto& [key, value] : step.env) {
            out << YAML::Key << key << YAML::Value << value;
        }
        out << YAML::EndMap;
    }

    if (!shell.no_rc) {
        out << YAML::Key << "noRc" << YAML::Value << false;
    }

    out << YAML::EndMap;
}

std::string to_yaml(const Step& step) {
    YAML::Emitter out;
    out.SetIndent(2);
    emit_step(out, step);
    check(out);
    return std::string(out.c_str()) + "\n";
}

// =============================================================================
// Jobs
// =============================================================================

void emit_job(YAML::Emitter& out, const Job& job) {
    out << YAML::BeginMap;
    out << YAML::Key << "job" << YAML::Value << job.name;

    if (!job.display_name.empty()) {
        out << YAML::Key << "displayName" << YAML::Value << job.display_name;
    }

    if (!job.depends_on.empty()) {
        out << YAML::Key << "dependsOn" << YAML::Value << YAML::BeginSeq;
        for (const auto& dep : job.depends_on) {
            out << dep;
        }
        out << YAML::EndSeq;
    }

    if (!job.pool_image.empty()) {
        out << YAML::Key << "pool" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "vmImage" << YAML::Value << job.pool_image;
        out << YAML::EndMap;
    }

    out << YAML::Key << "steps" << YAML::Value << YAML::BeginSeq;
    for (const auto& step : job.steps) {
        emit_step(out, step);
    }
    out << YAML::EndSeq;

    out << YAML::EndMap;
}

// =============================================================================
// Pipeline
// =============================================================================

std::string to_yaml(const Pipeline& pipeline) {
    YAML::Emitter out;
    out.SetIndent(2);

    out << YAML::BeginMap;

    if (!pipeline.name.empty()) {
        out << YAML::Key << "name" << YAML::Value << pipeline.name;
    }

    out << YAML::Key << "trigger" << YAML::Value;
    if (pipeline.trigger_branches.empty()) {
        out << "none";
    } else {
        emit_branches(out, pipeline.trigger_branches);
    }

    if (!pipeline.pr_branches.empty()) {
        out << YAML::Key << "pr" << YAML::Value;
        emit_branches(out, pipeline.pr_branches);
    }

    if (!pipeline.variables.empty()) {
        out << YAML::Key << "variables" << YAML::Value << YAML::BeginSeq;
        for (const auto& [name, value] : pipeline.variables) {
            out << YAML::BeginMap;
            out << YAML::Key << "name" << YAML::Value << name;
            out << YAML::Key << "value" << YAML::Value << value;
            out << YAML::EndMap;
        }
        out << YAML::EndSeq;
    }

    out << YAML::Key << "jobs" << YAML::Value << YAML::BeginSeq;
    for (const auto& job : pipeline.jobs) {
        emit_job(out, job);
    }
    out << YAML::EndSeq;

    out << YAML::EndMap;

    check(out);
    return std::string(out.c_str()) + "\n";
}

} // namespace pipeforge_yaml
