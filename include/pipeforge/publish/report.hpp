#pragma once

/// @file report.hpp
/// @brief JSON run report

#include "outcome.hpp"

#include <pipeforge/core/error.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>

namespace pipeforge_publish {

void to_json(nlohmann::json& j, const DefinitionReport& report);
void to_json(nlohmann::json& j, const RunResult& result);

/// Serialize a run result
///
/// Shape:
/// ```json
/// { "success": true, "fail_if_changed": false, "error": null,
///   "definitions": [ { "name": "...", "type": "...", "path": "...",
///                      "outcome": "created", "message": "" } ] }
/// ```
[[nodiscard]] nlohmann::json report_json(const RunResult& result);

/// Write the report to a file, creating parent directories
[[nodiscard]] pipeforge_core::Result<void> write_report(const RunResult& result,
                                                        const std::filesystem::path& path);

} // namespace pipeforge_publish
