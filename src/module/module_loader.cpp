/// @file module_loader.cpp
/// @brief Definition module loading implementation

#include <pipeforge/module/module_loader.hpp>

#include <pipeforge/core/log.hpp>

#include <memory>

namespace pipeforge_module {

using pipeforge_core::Error;
using pipeforge_core::LoadError;
using pipeforge_core::Result;

ModuleLoader::ModuleLoader(LoaderConfig config)
    : m_config(std::move(config))
{}

std::vector<std::filesystem::path> ModuleLoader::dependency_paths(
    const std::filesystem::path& module_path) const
{
    auto dir = module_path.parent_path();

    std::vector<std::filesystem::path> paths;
    paths.reserve(m_config.dependencies.size());
    for (const auto& name : m_config.dependencies) {
        paths.push_back(dir / library_file_name(name));
    }
    return paths;
}

Result<TypeCatalog> ModuleLoader::load(const std::filesystem::path& path) {
    auto logger = pipeforge_core::loader_logger();

    if (m_used) {
        return Error(LoadError::invalid_state("load() may only be called once per run"));
    }
    m_used = true;

    std::error_code ec;
    auto module_path = std::filesystem::absolute(path, ec);
    if (ec) {
        module_path = path;
    }

    if (!std::filesystem::is_regular_file(module_path, ec)) {
        return Error(LoadError::missing_artifact(module_path.string()));
    }

    logger->debug("Loading definition module {}", module_path.string());

    // Dependencies first, with global visibility
    std::vector<std::unique_ptr<ModuleLibrary>> dependencies;
    std::vector<TypeEntry> referenced;

    auto dep_paths = dependency_paths(module_path);
    for (std::size_t i = 0; i < dep_paths.size(); ++i) {
        const auto& dep_path = dep_paths[i];
        const auto& dep_name = m_config.dependencies[i];

        if (!std::filesystem::exists(dep_path, ec)) {
            return Error(LoadError::missing_dependency(dep_name, dep_path.string()));
        }

        auto library = ModuleLibrary::open(dep_path, SymbolScope::Shared);
        if (!library) {
            return library.error().with_context("dependency", dep_name);
        }

        // A dependency without a catalog contributes no types
        if ((*library)->exports_catalog()) {
            auto view = (*library)->catalog();
            if (!view) {
                return view.error();
            }
            auto entries = TypeCatalog::entries_of(**view);
            referenced.insert(referenced.end(), entries.begin(), entries.end());
        }

        logger->debug("Loaded dependency {} from {}", dep_name, dep_path.string());
        dependencies.push_back(std::move(*library));
    }

    // The module itself, private visibility
    auto module = ModuleLibrary::open(module_path, SymbolScope::Private);
    if (!module) {
        return module.error();
    }

    auto view = (*module)->catalog();
    if (!view) {
        return view.error();
    }

    auto catalog = TypeCatalog::from_view(**view, referenced);
    for (auto& dep : dependencies) {
        catalog.retain(std::move(dep));
    }
    catalog.retain(std::move(*module));

    logger->debug("Module {} declares {} type(s)", catalog.module_name(), catalog.size());

    return catalog;
}

} // namespace pipeforge_module
