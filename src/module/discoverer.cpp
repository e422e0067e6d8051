/// @file discoverer.cpp
/// @brief Definition discovery implementation

#include <pipeforge/module/discoverer.hpp>

#include <pipeforge/core/log.hpp>

#include <exception>

namespace pipeforge_module {

using pipeforge_core::DiscoveryError;
using pipeforge_core::Error;
using pipeforge_core::Result;

bool is_definition_type(const TypeDescriptor& type, std::string_view contract) {
    return type.is_concrete && type.derives_from(contract);
}

DefinitionDiscoverer::DefinitionDiscoverer(std::string contract)
    : m_contract(std::move(contract))
{}

std::vector<const TypeDescriptor*> DefinitionDiscoverer::find_types(const TypeCatalog& catalog) const {
    std::vector<const TypeDescriptor*> found;
    for (const auto& type : catalog.types()) {
        if (is_definition_type(type, m_contract)) {
            found.push_back(&type);
        }
    }
    return found;
}

Result<DefinitionInstance> DefinitionDiscoverer::instantiate(const TypeDescriptor& type) {
    if (!type.create || !type.destroy) {
        return Error(DiscoveryError::instantiation_failed(type.qualified_name, "type has no factory"));
    }

    DefinitionInstance instance;
    instance.type_name = type.qualified_name;
    instance.definition = DefinitionPtr(nullptr, type.destroy);

    // The definition's own name() is part of construction: it may run user code
    try {
        instance.definition.reset(type.create());
        if (instance.definition) {
            instance.name = instance.definition->name();
        }
    } catch (const std::exception& ex) {
        return Error(DiscoveryError::instantiation_failed(type.qualified_name, ex.what()));
    } catch (...) {
        return Error(DiscoveryError::instantiation_failed(type.qualified_name, "unknown exception"));
    }

    if (!instance.definition) {
        return Error(DiscoveryError::instantiation_failed(type.qualified_name, "factory returned null"));
    }
    if (instance.name.empty()) {
        instance.name = type.short_name();
    }
    return instance;
}

Result<std::vector<DefinitionInstance>> DefinitionDiscoverer::discover(const TypeCatalog& catalog) const {
    auto logger = pipeforge_core::loader_logger();

    std::vector<DefinitionInstance> instances;
    for (const auto* type : find_types(catalog)) {
        auto instance = instantiate(*type);
        if (!instance) {
            return instance.error();
        }
        logger->debug("Discovered {} ({} ancestor(s))", type->qualified_name, type->ancestors.size());
        instances.push_back(std::move(*instance));
    }

    return instances;
}

} // namespace pipeforge_module
