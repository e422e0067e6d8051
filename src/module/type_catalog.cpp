/// @file type_catalog.cpp
/// @brief TypeCatalog implementation

#include <pipeforge/module/type_catalog.hpp>

#include <algorithm>
#include <unordered_map>
#include <unordered_set>

namespace pipeforge_module {

// =============================================================================
// TypeDescriptor
// =============================================================================

std::string TypeDescriptor::short_name() const {
    auto pos = qualified_name.rfind("::");
    if (pos == std::string::npos) {
        return qualified_name;
    }
    return qualified_name.substr(pos + 2);
}

bool TypeDescriptor::derives_from(std::string_view name) const {
    return std::any_of(ancestors.begin(), ancestors.end(),
        [name](const std::string& ancestor) { return ancestor == name; });
}

// =============================================================================
// TypeCatalog
// =============================================================================

namespace {

std::string safe_string(const char* str) {
    return str ? std::string(str) : std::string();
}

} // anonymous namespace

TypeCatalog::~TypeCatalog() {
    m_types.clear();

    // Module first, then the libraries it was linked against
    while (!m_libraries.empty()) {
        m_libraries.pop_back();
    }
}

std::vector<TypeEntry> TypeCatalog::entries_of(const ModuleCatalogView& view) {
    std::vector<TypeEntry> entries;
    if (!view.types) {
        return entries;
    }
    entries.assign(view.types, view.types + view.type_count);
    return entries;
}

TypeCatalog TypeCatalog::from_view(
    const ModuleCatalogView& view,
    const std::vector<TypeEntry>& referenced)
{
    TypeCatalog catalog;
    catalog.m_module_name = safe_string(view.module_name);

    auto own = entries_of(view);

    // Own types shadow referenced types of the same name
    std::unordered_map<std::string, std::string> base_of;
    for (const auto& entry : referenced) {
        base_of[safe_string(entry.qualified_name)] = safe_string(entry.base_name);
    }
    for (const auto& entry : own) {
        base_of[safe_string(entry.qualified_name)] = safe_string(entry.base_name);
    }

    catalog.m_types.reserve(own.size());
    for (const auto& entry : own) {
        TypeDescriptor desc;
        desc.qualified_name = safe_string(entry.qualified_name);
        desc.base_name = safe_string(entry.base_name);
        desc.is_concrete = entry.is_concrete;
        desc.create = entry.create;
        desc.destroy = entry.destroy;

        std::unordered_set<std::string> visited{desc.qualified_name};
        std::string current = desc.base_name;
        while (!current.empty() && visited.insert(current).second) {
            desc.ancestors.push_back(current);
            auto it = base_of.find(current);
            if (it == base_of.end()) {
                break;
            }
            current = it->second;
        }

        catalog.m_types.push_back(std::move(desc));
    }

    return catalog;
}

void TypeCatalog::retain(std::unique_ptr<ModuleLibrary> library) {
    if (library) {
        m_libraries.push_back(std::move(library));
    }
}

const TypeDescriptor* TypeCatalog::find(std::string_view qualified_name) const {
    auto it = std::find_if(m_types.begin(), m_types.end(),
        [qualified_name](const TypeDescriptor& desc) {
            return desc.qualified_name == qualified_name;
        });
    return it != m_types.end() ? &*it : nullptr;
}

} // namespace pipeforge_module
