// pipeforge_module ModuleLibrary tests

#include <catch2/catch_test_macros.hpp>
#include <pipeforge/module/module_library.hpp>

#include "../support/scratch_directory.hpp"

using namespace pipeforge_module;
using pipeforge_core::LoadError;

namespace {

LoadError::Kind kind_of(const pipeforge_core::Error& error) {
    const auto* load = error.as<LoadError>();
    REQUIRE(load != nullptr);
    return load->kind;
}

} // anonymous namespace

TEST_CASE("Library file names", "[module][module_library]") {
    SECTION("logical names get the platform decoration") {
#if defined(_WIN32)
        REQUIRE(library_file_name("pipeforge_yaml") == "pipeforge_yaml.dll");
#elif defined(__APPLE__)
        REQUIRE(library_file_name("pipeforge_yaml") == "libpipeforge_yaml.dylib");
#else
        REQUIRE(library_file_name("pipeforge_yaml") == "libpipeforge_yaml.so");
#endif
    }

    SECTION("file names are kept") {
        REQUIRE(library_file_name("custom.so") == "custom.so");
        REQUIRE(library_file_name("Custom.DLL") == "Custom.DLL");
    }
}

TEST_CASE("ModuleLibrary open failures", "[module][module_library]") {
    pipeforge_test::ScratchDirectory dir("pipeforge-lib");

    SECTION("missing file") {
        auto lib = ModuleLibrary::open(dir / "libnothing.so", SymbolScope::Private);
        REQUIRE(lib.is_err());
        REQUIRE(kind_of(lib.error()) == LoadError::Kind::MissingArtifact);
    }

    SECTION("a directory is not a library") {
        auto lib = ModuleLibrary::open(dir.path(), SymbolScope::Private);
        REQUIRE(lib.is_err());
        REQUIRE(kind_of(lib.error()) == LoadError::Kind::MissingArtifact);
    }

    SECTION("not a shared object") {
        auto path = dir / library_file_name("fake");
        pipeforge_test::write_file(path, "this is not a shared object");

        auto lib = ModuleLibrary::open(path, SymbolScope::Shared);
        REQUIRE(lib.is_err());
        REQUIRE(kind_of(lib.error()) == LoadError::Kind::CorruptArtifact);
        REQUIRE(lib.error().message().find(path.string()) != std::string::npos);
    }
}

TEST_CASE("ModuleLibrary with a definition module", "[module][module_library]") {
    auto lib = ModuleLibrary::open(PIPEFORGE_FIXTURE_MODULE, SymbolScope::Private);
    REQUIRE(lib.is_ok());

    const ModuleLibrary& module = **lib;
    REQUIRE(module.path() == std::filesystem::path(PIPEFORGE_FIXTURE_MODULE));
    REQUIRE(module.scope() == SymbolScope::Private);
    REQUIRE(module.exports_catalog());

    auto view = module.catalog();
    REQUIRE(view.is_ok());
    REQUIRE((*view)->api_version == PIPEFORGE_MODULE_API_VERSION);
    REQUIRE(std::string((*view)->module_name) == "sample_definitions");
    REQUIRE((*view)->type_count == 5);
}
