/// @file module_library.cpp
/// @brief ModuleLibrary implementation

#include <pipeforge/module/module_library.hpp>

#ifdef _WIN32
#define NOMINMAX
#define WIN32_LEAN_AND_MEAN
#include <windows.h>
#else
#include <dlfcn.h>
#endif

namespace pipeforge_module {

using pipeforge_core::Error;
using pipeforge_core::LoadError;
using pipeforge_core::Result;

namespace {

#ifdef _WIN32

void* open_native(const std::filesystem::path& path, SymbolScope, std::string& reason) {
    HMODULE handle = LoadLibraryW(path.wstring().c_str());
    if (!handle) {
        reason = "LoadLibrary failed with error " + std::to_string(GetLastError());
    }
    return reinterpret_cast<void*>(handle);
}

void close_native(void* handle) {
    FreeLibrary(static_cast<HMODULE>(handle));
}

void* find_native(void* handle, const char* name) {
    return reinterpret_cast<void*>(GetProcAddress(static_cast<HMODULE>(handle), name));
}

#else

void* open_native(const std::filesystem::path& path, SymbolScope scope, std::string& reason) {
    const int flags = RTLD_NOW | (scope == SymbolScope::Shared ? RTLD_GLOBAL : RTLD_LOCAL);
    dlerror();
    void* handle = dlopen(path.c_str(), flags);
    if (!handle) {
        const char* error = dlerror();
        reason = error ? error : "dlopen failed";
    }
    return handle;
}

void close_native(void* handle) {
    dlclose(handle);
}

void* find_native(void* handle, const char* name) {
    return dlsym(handle, name);
}

#endif

} // anonymous namespace

ModuleLibrary::ModuleLibrary(void* handle, std::filesystem::path path, SymbolScope scope)
    : m_handle(handle)
    , m_path(std::move(path))
    , m_scope(scope)
{}

ModuleLibrary::~ModuleLibrary() {
    close_native(m_handle);
}

Result<std::unique_ptr<ModuleLibrary>> ModuleLibrary::open(
    const std::filesystem::path& path,
    SymbolScope scope)
{
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return Error(LoadError::missing_artifact(path.string()));
    }

    std::string reason;
    void* handle = open_native(path, scope, reason);
    if (!handle) {
        return Error(LoadError::corrupt_artifact(path.string(), reason));
    }

    return std::unique_ptr<ModuleLibrary>(new ModuleLibrary(handle, path, scope));
}

void* ModuleLibrary::symbol(const char* name) const noexcept {
    return find_native(m_handle, name);
}

bool ModuleLibrary::exports_catalog() const noexcept {
    return symbol(CATALOG_SYMBOL) != nullptr;
}

Result<const ModuleCatalogView*> ModuleLibrary::catalog() const {
    const std::string path = m_path.string();

    void* entry = symbol(CATALOG_SYMBOL);
    if (!entry) {
        return Error(LoadError::missing_entry_point(path, CATALOG_SYMBOL));
    }

    const ModuleCatalogView* view = reinterpret_cast<ModuleCatalogFn>(entry)();
    if (!view) {
        return Error(LoadError::corrupt_artifact(path, "catalog entry point returned null"));
    }
    if (view->api_version != PIPEFORGE_MODULE_API_VERSION) {
        return Error(LoadError::api_mismatch(path, PIPEFORGE_MODULE_API_VERSION, view->api_version));
    }

    return view;
}

std::string library_file_name(std::string_view name) {
    if (std::filesystem::path(name).has_extension()) {
        return std::string(name);
    }
#ifdef _WIN32
    return std::string(name) + ".dll";
#elif defined(__APPLE__)
    return "lib" + std::string(name) + ".dylib";
#else
    return "lib" + std::string(name) + ".so";
#endif
}

} // namespace pipeforge_module
