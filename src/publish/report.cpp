/// @file report.cpp
/// @brief JSON run report implementation

#include <pipeforge/publish/report.hpp>

#include <fstream>

namespace pipeforge_publish {

void to_json(nlohmann::json& j, const DefinitionReport& report) {
    j = nlohmann::json{
        {"name", report.name},
        {"type", report.type_name},
        {"path", report.path.generic_string()},
        {"outcome", outcome_name(report.outcome)},
        {"message", report.message},
    };
}

void to_json(nlohmann::json& j, const RunResult& result) {
    j = nlohmann::json::object();
    j["success"] = result.success();
    j["fail_if_changed"] = result.fail_if_changed;
    j["error"] = result.fatal ? nlohmann::json(result.fatal->message()) : nlohmann::json(nullptr);

    auto definitions = nlohmann::json::array();
    for (const auto& report : result.definitions) {
        definitions.push_back(nlohmann::json(report));
    }
    j["definitions"] = std::move(definitions);
}

nlohmann::json report_json(const RunResult& result) {
    return nlohmann::json(result);
}

pipeforge_core::Result<void> write_report(const RunResult& result, const std::filesystem::path& path) {
    std::error_code ec;
    auto parent = path.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return pipeforge_core::Error(pipeforge_core::ErrorCode::IOError,
                "Cannot create report directory " + parent.string() + ": " + ec.message());
        }
    }

    std::ofstream file(path);
    if (!file) {
        return pipeforge_core::Error(pipeforge_core::ErrorCode::IOError,
            "Cannot open report file " + path.string());
    }

    file << report_json(result).dump(2) << '\n';
    if (!file) {
        return pipeforge_core::Error(pipeforge_core::ErrorCode::IOError,
            "Failed to write report file " + path.string());
    }

    return pipeforge_core::Ok();
}

} // namespace pipeforge_publish
