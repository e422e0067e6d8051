#pragma once

/// @file type_catalog.hpp
/// @brief Queryable catalog of the types a definition module declares

#include "abi.hpp"
#include "module_library.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace pipeforge_module {

// =============================================================================
// TypeDescriptor
// =============================================================================

/// One type declared by a module, with its resolved ancestry
struct TypeDescriptor {
    std::string qualified_name;
    std::string base_name;               ///< Immediate base, empty for roots
    bool is_concrete = false;
    std::vector<std::string> ancestors;  ///< Qualified names, nearest first
    DefinitionFactoryFn create = nullptr;
    DefinitionDestroyFn destroy = nullptr;

    /// Name without namespace qualification
    [[nodiscard]] std::string short_name() const;

    /// True if any ancestor has the given qualified name
    [[nodiscard]] bool derives_from(std::string_view name) const;
};

// =============================================================================
// TypeCatalog
// =============================================================================

/// Types declared by one module, in registration order
///
/// A catalog owns the libraries it was read from. Function pointers in its
/// descriptors, and every object created through them, are valid only while
/// the catalog is alive.
///
/// Ancestor chains are resolved through the module's own types first, then
/// through the referenced types exported by its dependency libraries. A base
/// name that resolves nowhere ends the chain; the name itself is still
/// recorded as an ancestor.
class TypeCatalog {
public:
    TypeCatalog() = default;
    ~TypeCatalog();

    TypeCatalog(const TypeCatalog&) = delete;
    TypeCatalog& operator=(const TypeCatalog&) = delete;
    TypeCatalog(TypeCatalog&&) noexcept = default;
    TypeCatalog& operator=(TypeCatalog&&) noexcept = default;

    /// Build a catalog from a module's exported view
    ///
    /// @param view Types declared by the module
    /// @param referenced Types declared by libraries the module builds on
    [[nodiscard]] static TypeCatalog from_view(
        const ModuleCatalogView& view,
        const std::vector<TypeEntry>& referenced = {});

    /// Read the raw entries of a view (used for dependency catalogs)
    [[nodiscard]] static std::vector<TypeEntry> entries_of(const ModuleCatalogView& view);

    /// Take ownership of a library this catalog's descriptors point into
    void retain(std::unique_ptr<ModuleLibrary> library);

    [[nodiscard]] const std::string& module_name() const noexcept { return m_module_name; }
    [[nodiscard]] const std::vector<TypeDescriptor>& types() const noexcept { return m_types; }
    [[nodiscard]] std::size_t size() const noexcept { return m_types.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_types.empty(); }

    /// Find a declared type by qualified name (nullptr if absent)
    [[nodiscard]] const TypeDescriptor* find(std::string_view qualified_name) const;

    /// Number of libraries kept alive by this catalog
    [[nodiscard]] std::size_t library_count() const noexcept { return m_libraries.size(); }

private:
    // Destroyed after m_types so that no descriptor outlives its code
    std::vector<std::unique_ptr<ModuleLibrary>> m_libraries;
    std::string m_module_name;
    std::vector<TypeDescriptor> m_types;
};

} // namespace pipeforge_module
