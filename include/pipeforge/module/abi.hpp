#pragma once

/// @file abi.hpp
/// @brief Binary interface between the publisher and definition modules
///
/// A definition module is a shared library that exports one C symbol,
/// `pipeforge_module_catalog`, returning a ModuleCatalogView. The view lists
/// every type the module registered, concrete or abstract, with the qualified
/// name of its immediate base. Concrete types carry a factory and a destroyer
/// so that objects are created and freed by the module that owns their code.
///
/// Only plain pointers and integers cross this boundary.

#include <cstddef>
#include <cstdint>

namespace pipeforge_definition { class IDefinition; }

// =============================================================================
// Export Macros
// =============================================================================

#if defined(_WIN32) || defined(__CYGWIN__)
    #define PIPEFORGE_EXPORT __declspec(dllexport)
    #define PIPEFORGE_HIDDEN
#else
    #if __GNUC__ >= 4
        #define PIPEFORGE_EXPORT __attribute__((visibility("default")))
        #define PIPEFORGE_HIDDEN __attribute__((visibility("hidden")))
    #else
        #define PIPEFORGE_EXPORT
        #define PIPEFORGE_HIDDEN
    #endif
#endif

/// Bumped whenever TypeEntry or ModuleCatalogView change layout
#define PIPEFORGE_MODULE_API_VERSION 1u

namespace pipeforge_module {

/// Factory for a concrete definition type (zero-argument construction)
using DefinitionFactoryFn = pipeforge_definition::IDefinition* (*)();

/// Destroyer matching DefinitionFactoryFn
using DefinitionDestroyFn = void (*)(pipeforge_definition::IDefinition*);

/// One registered type as exported by a module
struct TypeEntry {
    const char* qualified_name;   ///< e.g. "my_pipelines::PullRequestPipeline"
    const char* base_name;        ///< Immediate base, nullptr for roots
    bool is_concrete;
    DefinitionFactoryFn create;   ///< nullptr for abstract types
    DefinitionDestroyFn destroy;  ///< nullptr for abstract types
};

/// Catalog of a module's registered types
struct ModuleCatalogView {
    std::uint32_t api_version;
    const char* module_name;
    const TypeEntry* types;
    std::size_t type_count;
};

/// Signature of the exported catalog symbol
using ModuleCatalogFn = const ModuleCatalogView* (*)();

/// Name of the exported catalog symbol
inline constexpr const char* CATALOG_SYMBOL = "pipeforge_module_catalog";

} // namespace pipeforge_module
