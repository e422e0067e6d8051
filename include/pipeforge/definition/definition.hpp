#pragma once

/// @file definition.hpp
/// @brief Definition contract and base classes
///
/// Every definition a module exposes derives, directly or through abstract
/// intermediates, from DefinitionBase. Each class in the chain names itself
/// and its base with PIPEFORGE_TYPE so that the chain can be recovered by
/// qualified name once the module is loaded.
///
/// Example:
/// ```cpp
/// class PullRequestPipeline : public pipeforge_definition::PipelineDefinition {
///     PIPEFORGE_TYPE(PullRequestPipeline, "my_pipelines::PullRequestPipeline",
///                    pipeforge_definition::PipelineDefinition)
/// protected:
///     std::string target_file() const override { return "eng/pr.yml"; }
///     pipeforge_model::Pipeline pipeline() const override { ... }
/// };
/// PIPEFORGE_DEFINITION(PullRequestPipeline)
/// ```

#include <pipeforge/core/error.hpp>
#include <pipeforge/model/pipeline.hpp>

#include <filesystem>
#include <string>
#include <vector>

/// Declare a definition type's identity
///
/// @param Self The class being declared
/// @param QualifiedName Its fully qualified name as a string literal
/// @param Base Its immediate definition base class
#define PIPEFORGE_TYPE(Self, QualifiedName, Base)                                   \
public:                                                                             \
    using self_type = Self;                                                         \
    using base_type = Base;                                                         \
    static constexpr const char* qualified_type_name() noexcept { return QualifiedName; } \
    const char* type_name() const noexcept override { return QualifiedName; }      \
private:

namespace pipeforge_definition {

template<typename T>
using Result = pipeforge_core::Result<T>;

// =============================================================================
// IDefinition
// =============================================================================

/// Capability surface of one publishable definition
class IDefinition {
public:
    using self_type = IDefinition;
    using base_type = void;
    static constexpr const char* qualified_type_name() noexcept {
        return "pipeforge_definition::IDefinition";
    }

    virtual ~IDefinition() = default;

    /// Fully qualified name of the most derived type
    [[nodiscard]] virtual const char* type_name() const noexcept = 0;

    /// Name used in log output (the unqualified type name by default)
    [[nodiscard]] virtual std::string name() const;

    /// File this definition publishes to
    [[nodiscard]] virtual Result<std::filesystem::path> target_path() const = 0;

    /// Check the definition's configuration
    [[nodiscard]] virtual Result<void> validate() const = 0;

    /// Render the definition and write it to target_path()
    [[nodiscard]] virtual Result<void> publish() const = 0;
};

// =============================================================================
// DefinitionBase
// =============================================================================

/// Base for file-backed definitions
///
/// Publishing writes header() as "### " comment lines followed by render().
/// Parent directories of the target are created as needed. The write is not
/// atomic.
class DefinitionBase : public IDefinition {
    PIPEFORGE_TYPE(DefinitionBase, "pipeforge_definition::DefinitionBase", IDefinition)

public:
    [[nodiscard]] Result<std::filesystem::path> target_path() const override;
    [[nodiscard]] Result<void> publish() const override;

    /// Header banner followed by the rendered body
    [[nodiscard]] Result<std::string> document() const;

protected:
    /// Path of the published file, absolute or relative to the working directory
    [[nodiscard]] virtual std::string target_file() const = 0;

    /// Body of the published file
    [[nodiscard]] virtual Result<std::string> render() const = 0;

    /// Banner lines written above the body, without the comment marker
    [[nodiscard]] virtual std::vector<std::string> header() const;
};

// =============================================================================
// PipelineDefinition
// =============================================================================

/// Definition of one CI pipeline rendered to YAML
class PipelineDefinition : public DefinitionBase {
    PIPEFORGE_TYPE(PipelineDefinition, "pipeforge_definition::PipelineDefinition", DefinitionBase)

public:
    [[nodiscard]] Result<void> validate() const override;

protected:
    /// Build the pipeline model
    [[nodiscard]] virtual pipeforge_model::Pipeline pipeline() const = 0;

    [[nodiscard]] Result<std::string> render() const override;
};

// =============================================================================
// Validation
// =============================================================================

/// Collect every structural problem of a pipeline
///
/// @return Empty if the pipeline is valid
[[nodiscard]] std::vector<std::string> pipeline_problems(const pipeforge_model::Pipeline& pipeline);

/// Validate a pipeline, reporting all problems in one error
[[nodiscard]] Result<void> validate_pipeline(const pipeforge_model::Pipeline& pipeline,
                                             const std::string& definition_name = {});

} // namespace pipeforge_definition
