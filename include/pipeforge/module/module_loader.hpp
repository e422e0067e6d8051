#pragma once

/// @file module_loader.hpp
/// @brief Loads a definition module and the libraries it depends on

#include "type_catalog.hpp"

#include <pipeforge/core/error.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace pipeforge_module {

// =============================================================================
// LoaderConfig
// =============================================================================

/// Explicit loader configuration, read-only once a loader is constructed
struct LoaderConfig {
    /// Auxiliary libraries opened from the module's directory before the
    /// module itself, in order. Logical names are mapped to platform file
    /// names (see library_file_name).
    std::vector<std::string> dependencies = {"pipeforge_yaml", "pipeforge_definitions"};
};

// =============================================================================
// ModuleLoader
// =============================================================================

/// One-shot loader for a compiled definition module
///
/// Dependencies are opened with global symbol visibility so that the
/// module's undefined references bind to them, then the module is opened
/// and its exported catalog is read. Each dependency may also export a
/// catalog; its types become referenced types used to resolve ancestry
/// across library boundaries.
class ModuleLoader {
public:
    explicit ModuleLoader(LoaderConfig config = {});

    ModuleLoader(const ModuleLoader&) = delete;
    ModuleLoader& operator=(const ModuleLoader&) = delete;

    /// Load the module at path
    ///
    /// May be called once. A second call fails with LoadError::invalid_state.
    [[nodiscard]] pipeforge_core::Result<TypeCatalog> load(const std::filesystem::path& path);

    [[nodiscard]] const LoaderConfig& config() const noexcept { return m_config; }
    [[nodiscard]] bool has_loaded() const noexcept { return m_used; }

    /// Paths the dependencies would be searched at for a given module
    [[nodiscard]] std::vector<std::filesystem::path> dependency_paths(
        const std::filesystem::path& module_path) const;

private:
    LoaderConfig m_config;
    bool m_used = false;
};

} // namespace pipeforge_module
