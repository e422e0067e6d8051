#pragma once

/// @file discoverer.hpp
/// @brief Finds and instantiates definition types in a catalog

#include "type_catalog.hpp"

#include <pipeforge/core/error.hpp>
#include <pipeforge/definition/definition.hpp>

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace pipeforge_module {

/// Owning pointer that frees a definition through its module's destroyer
using DefinitionPtr = std::unique_ptr<pipeforge_definition::IDefinition, DefinitionDestroyFn>;

// =============================================================================
// DefinitionInstance
// =============================================================================

/// One instantiated definition
///
/// Must be destroyed before the catalog it came from.
struct DefinitionInstance {
    std::string type_name;   ///< Qualified type name
    std::string name;        ///< Unqualified name, used in log output
    DefinitionPtr definition{nullptr, nullptr};

    [[nodiscard]] pipeforge_definition::IDefinition& get() const { return *definition; }
    [[nodiscard]] pipeforge_definition::IDefinition* operator->() const { return definition.get(); }
};

/// Wrap an object created in this binary (used where no module is involved)
template<typename T, typename... Args>
[[nodiscard]] DefinitionInstance make_instance(Args&&... args) {
    DefinitionInstance instance;
    instance.type_name = T::qualified_type_name();
    auto* raw = new T(std::forward<Args>(args)...);
    instance.definition = DefinitionPtr(raw, [](pipeforge_definition::IDefinition* def) { delete def; });
    instance.name = instance.definition->name();
    return instance;
}

// =============================================================================
// Discovery
// =============================================================================

/// True if the type is concrete and has the contract among its ancestors
///
/// Types are matched by qualified name only. Type identity is not reliable
/// across separately loaded libraries, so no other check is made.
[[nodiscard]] bool is_definition_type(const TypeDescriptor& type, std::string_view contract);

/// Finds every definition type in a catalog and creates one instance of each
class DefinitionDiscoverer {
public:
    explicit DefinitionDiscoverer(
        std::string contract = pipeforge_definition::DefinitionBase::qualified_type_name());

    /// Matching types in catalog order, without instantiating them
    [[nodiscard]] std::vector<const TypeDescriptor*> find_types(const TypeCatalog& catalog) const;

    /// Instantiate every matching type, in catalog order
    ///
    /// Any instantiation failure fails the whole call. An empty result is not
    /// an error here; callers decide what zero definitions means.
    [[nodiscard]] pipeforge_core::Result<std::vector<DefinitionInstance>> discover(
        const TypeCatalog& catalog) const;

    /// Instantiate one type
    [[nodiscard]] static pipeforge_core::Result<DefinitionInstance> instantiate(const TypeDescriptor& type);

    [[nodiscard]] const std::string& contract() const noexcept { return m_contract; }

private:
    std::string m_contract;
};

/// Discover definitions of a statically known contract type
template<typename Contract>
[[nodiscard]] pipeforge_core::Result<std::vector<DefinitionInstance>> discover(const TypeCatalog& catalog) {
    return DefinitionDiscoverer(Contract::qualified_type_name()).discover(catalog);
}

} // namespace pipeforge_module
