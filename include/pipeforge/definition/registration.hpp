#pragma once

/// @file registration.hpp
/// @brief Type registration for definition modules
///
/// A definition module registers its types at static-initialization time
/// and exports the resulting catalog through PIPEFORGE_MODULE:
///
/// ```cpp
/// PIPEFORGE_ABSTRACT(my_pipelines::ReleasePipeline)
/// PIPEFORGE_DEFINITION(my_pipelines::NightlyPipeline)
/// PIPEFORGE_MODULE(my_pipelines)
/// ```
///
/// Types are listed in registration order, which is the order definitions
/// are discovered and published in. Intermediate bases that were not
/// registered explicitly are added as abstract entries ahead of their first
/// registered descendant, so every chain reaches the library's own types.

#include "definition.hpp"

#include <pipeforge/module/abi.hpp>

#include <algorithm>
#include <deque>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace pipeforge_definition {

/// Types exported by libpipeforge_definitions itself
template<typename T>
inline constexpr bool is_library_type_v =
    std::is_same_v<T, IDefinition> ||
    std::is_same_v<T, DefinitionBase> ||
    std::is_same_v<T, PipelineDefinition>;

// =============================================================================
// ModuleRegistry
// =============================================================================

/// Types registered by one module
///
/// Strings are owned by the registry; the exported view points into it and
/// stays valid for the lifetime of the module.
class ModuleRegistry {
public:
    explicit ModuleRegistry(std::string module_name)
        : m_module_name(std::move(module_name)) {}

    ModuleRegistry(const ModuleRegistry&) = delete;
    ModuleRegistry& operator=(const ModuleRegistry&) = delete;

    /// Register a concrete definition (default-constructible)
    template<typename T>
    bool add_definition() {
        check_type<T>();
        static_assert(!std::is_abstract_v<T>, "PIPEFORGE_DEFINITION requires a concrete type");
        static_assert(std::is_default_constructible_v<T>,
            "Definitions are created with their zero-argument constructor");

        add_ancestors<T>();
        add(T::qualified_type_name(), base_name<T>(), true,
            []() -> IDefinition* { return new T(); },
            [](IDefinition* def) { delete def; });
        return true;
    }

    /// Register an abstract type so that it can be resolved as an ancestor
    template<typename T>
    bool add_abstract() {
        check_type<T>();
        add_ancestors<T>();
        add(T::qualified_type_name(), base_name<T>(), false, nullptr, nullptr);
        return true;
    }

    [[nodiscard]] const std::string& module_name() const noexcept { return m_module_name; }
    /// Number of exported entries
    [[nodiscard]] std::size_t size() const noexcept {
        return static_cast<std::size_t>(std::count_if(m_records.begin(), m_records.end(),
            [](const Record& rec) { return !rec.superseded; }));
    }

    /// Build the exported view; valid until the next registration
    [[nodiscard]] const pipeforge_module::ModuleCatalogView* view() {
        m_entries.clear();
        m_entries.reserve(m_records.size());
        for (const auto& rec : m_records) {
            if (rec.superseded) {
                continue;
            }
            m_entries.push_back(pipeforge_module::TypeEntry{
                rec.qualified_name.c_str(),
                rec.base_name.empty() ? nullptr : rec.base_name.c_str(),
                rec.is_concrete,
                rec.create,
                rec.destroy,
            });
        }

        m_view.api_version = PIPEFORGE_MODULE_API_VERSION;
        m_view.module_name = m_module_name.c_str();
        m_view.types = m_entries.data();
        m_view.type_count = m_entries.size();
        return &m_view;
    }

private:
    struct Record {
        std::string qualified_name;
        std::string base_name;
        bool is_concrete;
        pipeforge_module::DefinitionFactoryFn create;
        pipeforge_module::DefinitionDestroyFn destroy;
        bool superseded = false;
    };

    template<typename T>
    static void check_type() {
        static_assert(std::is_base_of_v<IDefinition, T>, "Registered types must derive from IDefinition");
        static_assert(std::is_same_v<typename T::self_type, T>,
            "Type is missing its PIPEFORGE_TYPE declaration");
    }

    template<typename T>
    static const char* base_name() {
        if constexpr (std::is_void_v<typename T::base_type>) {
            return nullptr;
        } else {
            return T::base_type::qualified_type_name();
        }
    }

    /// Register every base of T up to the library's own types, root first
    template<typename T>
    void add_ancestors() {
        using Base = typename T::base_type;
        if constexpr (!std::is_void_v<Base> && !is_library_type_v<Base>) {
            check_type<Base>();
            add_ancestors<Base>();
            add(Base::qualified_type_name(), base_name<Base>(), false, nullptr, nullptr);
        }
    }

    Record* find_record(std::string_view qualified_name) {
        for (auto& rec : m_records) {
            if (!rec.superseded && rec.qualified_name == qualified_name) {
                return &rec;
            }
        }
        return nullptr;
    }

    // A name is exported once. A concrete registration replaces an abstract
    // entry of the same name but is listed at its own position.
    void add(const char* qualified_name, const char* base, bool concrete,
             pipeforge_module::DefinitionFactoryFn create,
             pipeforge_module::DefinitionDestroyFn destroy) {
        if (Record* existing = find_record(qualified_name)) {
            if (!concrete || existing->is_concrete) {
                return;
            }
            existing->superseded = true;
        }
        m_records.push_back(Record{qualified_name, base ? base : "", concrete, create, destroy});
    }

    std::string m_module_name;
    std::deque<Record> m_records;
    std::vector<pipeforge_module::TypeEntry> m_entries;
    pipeforge_module::ModuleCatalogView m_view{};
};

/// The calling module's registry (defined by PIPEFORGE_MODULE)
PIPEFORGE_HIDDEN ModuleRegistry& module_registry();

} // namespace pipeforge_definition

// =============================================================================
// Registration Macros
// =============================================================================

#define PIPEFORGE_REG_CONCAT_INNER(a, b) a##b
#define PIPEFORGE_REG_CONCAT(a, b) PIPEFORGE_REG_CONCAT_INNER(a, b)

/// Register a concrete definition type
#define PIPEFORGE_DEFINITION(Type)                                                  \
    [[maybe_unused]] static const bool PIPEFORGE_REG_CONCAT(pipeforge_registered_, __COUNTER__) = \
        ::pipeforge_definition::module_registry().add_definition<Type>();

/// Register an abstract intermediate type
#define PIPEFORGE_ABSTRACT(Type)                                                    \
    [[maybe_unused]] static const bool PIPEFORGE_REG_CONCAT(pipeforge_registered_, __COUNTER__) = \
        ::pipeforge_definition::module_registry().add_abstract<Type>();

/// Define the module's registry and export its catalog
///
/// Use exactly once per module, in any one source file.
#define PIPEFORGE_MODULE(Name)                                                      \
    PIPEFORGE_HIDDEN ::pipeforge_definition::ModuleRegistry&                        \
    pipeforge_definition::module_registry() {                                       \
        static ::pipeforge_definition::ModuleRegistry registry(#Name);              \
        return registry;                                                            \
    }                                                                               \
    extern "C" PIPEFORGE_EXPORT const ::pipeforge_module::ModuleCatalogView*        \
    pipeforge_module_catalog() {                                                    \
        return ::pipeforge_definition::module_registry().view();                    \
    }
