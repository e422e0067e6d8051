#pragma once

/// @file module_library.hpp
/// @brief A definition module or one of its dependencies, opened in-process
///
/// Dependency libraries are opened with shared symbol scope so that the
/// definition module, opened afterwards with private scope, binds to them.
/// Failures are reported as LoadError.

#include "abi.hpp"

#include <pipeforge/core/error.hpp>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace pipeforge_module {

/// Visibility of a library's symbols to libraries opened after it
enum class SymbolScope : std::uint8_t {
    Private,    ///< The definition module itself
    Shared,     ///< Libraries the module was linked against
};

// =============================================================================
// ModuleLibrary
// =============================================================================

/// An open shared library, closed on destruction
///
/// Function pointers read from the library, and objects its factories
/// created, must not outlive it.
class ModuleLibrary {
public:
    ~ModuleLibrary();

    ModuleLibrary(const ModuleLibrary&) = delete;
    ModuleLibrary& operator=(const ModuleLibrary&) = delete;

    /// Open a library file
    ///
    /// Fails with LoadError::missing_artifact when the file does not exist
    /// and LoadError::corrupt_artifact when the platform loader rejects it.
    [[nodiscard]] static pipeforge_core::Result<std::unique_ptr<ModuleLibrary>> open(
        const std::filesystem::path& path,
        SymbolScope scope);

    /// True if the library exports the catalog entry point
    [[nodiscard]] bool exports_catalog() const noexcept;

    /// Call the catalog entry point and check its API version
    [[nodiscard]] pipeforge_core::Result<const ModuleCatalogView*> catalog() const;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return m_path; }
    [[nodiscard]] SymbolScope scope() const noexcept { return m_scope; }

private:
    ModuleLibrary(void* handle, std::filesystem::path path, SymbolScope scope);

    [[nodiscard]] void* symbol(const char* name) const noexcept;

    void* m_handle;
    std::filesystem::path m_path;
    SymbolScope m_scope;
};

/// File name of a library given by logical name
///
/// "pipeforge_yaml" becomes "libpipeforge_yaml.so" on Linux,
/// "libpipeforge_yaml.dylib" on macOS and "pipeforge_yaml.dll" on Windows.
/// A name that already has an extension is taken as a file name.
[[nodiscard]] std::string library_file_name(std::string_view name);

} // namespace pipeforge_module
