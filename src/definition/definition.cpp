/// @file definition.cpp
/// @brief Definition base class implementation

#include <pipeforge/definition/definition.hpp>

#include <pipeforge/yaml/emitter.hpp>

#include <fstream>
#include <set>
#include <sstream>
#include <stdexcept>

namespace pipeforge_definition {

using pipeforge_core::DefinitionError;
using pipeforge_core::Error;
using pipeforge_core::Ok;

// =============================================================================
// IDefinition
// =============================================================================

std::string IDefinition::name() const {
    std::string qualified = type_name();
    auto pos = qualified.rfind("::");
    return pos == std::string::npos ? qualified : qualified.substr(pos + 2);
}

// =============================================================================
// DefinitionBase
// =============================================================================

Result<std::filesystem::path> DefinitionBase::target_path() const {
    std::filesystem::path path = target_file();

    if (path.empty()) {
        return Error(DefinitionError::invalid_target_path(name(), "target path is empty"));
    }

    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) {
        return Error(DefinitionError::invalid_target_path(name(), path.string() + " is a directory"));
    }

    return path;
}

std::vector<std::string> DefinitionBase::header() const {
    return {
        "DO NOT MODIFY THIS FILE!",
        "",
        "This file was generated by pipeforge from " + std::string(type_name()),
        "To make changes, change the definition and publish it again",
    };
}

Result<std::string> DefinitionBase::document() const {
    auto body = render();
    if (!body) {
        return body.error();
    }

    std::ostringstream oss;
    for (const auto& line : header()) {
        oss << (line.empty() ? "###" : "### " + line) << '\n';
    }
    oss << '\n' << *body;

    return oss.str();
}

Result<void> DefinitionBase::publish() const {
    auto path = target_path();
    if (!path) {
        return path.error();
    }

    auto content = document();
    if (!content) {
        return content.error();
    }

    std::error_code ec;
    auto parent = path->parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return Error(DefinitionError::publish_failed(name(),
                "cannot create directory " + parent.string() + ": " + ec.message()));
        }
    }

    std::ofstream file(*path, std::ios::binary | std::ios::trunc);
    if (!file) {
        return Error(DefinitionError::publish_failed(name(), "cannot open " + path->string() + " for writing"));
    }

    file.write(content->data(), static_cast<std::streamsize>(content->size()));
    file.close();
    if (!file) {
        return Error(DefinitionError::publish_failed(name(), "write to " + path->string() + " failed"));
    }

    return Ok();
}

// =============================================================================
// PipelineDefinition
// =============================================================================

Result<void> PipelineDefinition::validate() const {
    return validate_pipeline(pipeline(), name());
}

Result<std::string> PipelineDefinition::render() const {
    try {
        return pipeforge_yaml::to_yaml(pipeline());
    } catch (const std::runtime_error& ex) {
        return Error(DefinitionError::publish_failed(name(), ex.what()));
    }
}

// =============================================================================
// Validation
// =============================================================================

std::vector<std::string> pipeline_problems(const pipeforge_model::Pipeline& pipeline) {
    std::vector<std::string> problems;

    if (pipeline.jobs.empty()) {
        problems.push_back("pipeline has no jobs");
    }

    std::set<std::string> names;
    for (std::size_t i = 0; i < pipeline.jobs.size(); ++i) {
        const auto& job = pipeline.jobs[i];
        const std::string label = job.name.empty() ? "job #" + std::to_string(i + 1) : "job '" + job.name + "'";

        if (job.name.empty()) {
            problems.push_back(label + " has no name");
        } else if (!names.insert(job.name).second) {
            problems.push_back("duplicate job name '" + job.name + "'");
        }

        if (job.steps.empty()) {
            problems.push_back(label + " has no steps");
        }

        for (std::size_t s = 0; s < job.steps.size(); ++s) {
            const auto& step = job.steps[s];
            if (const auto* task = std::get_if<pipeforge_model::InlineBashTask>(&step.task)) {
                if (task->contents.empty()) {
                    problems.push_back(label + " step #" + std::to_string(s + 1) + " has an empty script");
                }
            }
            if (step.timeout_in_minutes && *step.timeout_in_minutes < 0) {
                problems.push_back(label + " step #" + std::to_string(s + 1) + " has a negative timeout");
            }
        }
    }

    // dependsOn may only name jobs of this pipeline
    for (const auto& job : pipeline.jobs) {
        for (const auto& dep : job.depends_on) {
            if (names.find(dep) == names.end()) {
                problems.push_back("job '" + job.name + "' depends on unknown job '" + dep + "'");
            }
        }
    }

    return problems;
}

Result<void> validate_pipeline(const pipeforge_model::Pipeline& pipeline,
                               const std::string& definition_name) {
    auto problems = pipeline_problems(pipeline);
    if (problems.empty()) {
        return Ok();
    }

    std::string message = problems.front();
    for (std::size_t i = 1; i < problems.size(); ++i) {
        message += "; " + problems[i];
    }

    return Error(DefinitionError::validation_failed(definition_name, message));
}

} // namespace pipeforge_definition
