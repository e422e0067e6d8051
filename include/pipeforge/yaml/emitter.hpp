#pragma once

/// @file emitter.hpp
/// @brief YAML rendering of the pipeline model
///
/// Output is deterministic: the same model always renders to the same
/// bytes. Fields are emitted in a fixed order and fields still holding
/// their default value are left out.

#include <pipeforge/model/pipeline.hpp>

#include <string>

namespace YAML { class Emitter; }

namespace pipeforge_yaml {

/// Render a whole pipeline document
///
/// @throws std::runtime_error if the emitter rejects the document
[[nodiscard]] std::string to_yaml(const pipeforge_model::Pipeline& pipeline);

/// Render a single step as a standalone mapping
[[nodiscard]] std::string to_yaml(const pipeforge_model::Step& step);

/// Append a step mapping to an emitter already positioned for a value
void emit_step(YAML::Emitter& out, const pipeforge_model::Step& step);

/// Append a job mapping to an emitter already positioned for a value
void emit_job(YAML::Emitter& out, const pipeforge_model::Job& job);

} // namespace pipeforge_yaml
