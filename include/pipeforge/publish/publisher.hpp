#pragma once

/// @file publisher.hpp
/// @brief Publish orchestration: validate, publish and classify every definition

#include "outcome.hpp"

#include <pipeforge/module/discoverer.hpp>
#include <pipeforge/module/type_catalog.hpp>

#include <string>
#include <vector>

namespace pipeforge_publish {

struct PublisherConfig {
    /// Turn Created/Changed outcomes into a failed run
    bool fail_if_changed = false;

    /// Qualified name of the contract definitions derive from
    std::string contract = pipeforge_definition::DefinitionBase::qualified_type_name();
};

/// Drives one publish run
///
/// Definitions are processed one at a time in discovery order. A failure in
/// one definition is recorded against it and the run moves on; only load and
/// discovery failures stop a run.
class Publisher {
public:
    explicit Publisher(PublisherConfig config = {});

    /// Discover every definition in the catalog and publish it
    ///
    /// Zero definitions is a fatal error.
    [[nodiscard]] RunResult run(const pipeforge_module::TypeCatalog& catalog) const;

    /// Publish already discovered definitions
    [[nodiscard]] RunResult publish_all(const std::vector<pipeforge_module::DefinitionInstance>& instances) const;

    /// Publish one definition
    [[nodiscard]] DefinitionReport publish_one(const pipeforge_module::DefinitionInstance& instance) const;

    [[nodiscard]] const PublisherConfig& config() const noexcept { return m_config; }

private:
    PublisherConfig m_config;
};

} // namespace pipeforge_publish
