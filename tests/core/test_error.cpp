// pipeforge_core Error and Result tests

#include <catch2/catch_test_macros.hpp>
#include <pipeforge/core/error.hpp>
#include <string>

using namespace pipeforge_core;

// =============================================================================
// Error Tests
// =============================================================================

TEST_CASE("Error construction", "[core][error]") {
    SECTION("from string") {
        Error err("Test error");
        REQUIRE(err.message() == "Test error");
        REQUIRE(err.code() == ErrorCode::Unknown);
    }

    SECTION("from code and message") {
        Error err(ErrorCode::IOError, "Disk full");
        REQUIRE(err.code() == ErrorCode::IOError);
        REQUIRE(err.message() == "Disk full");
    }

    SECTION("with context") {
        Error err = Error("Base error").with_context("path", "/out/a.yml");
        auto* ctx = err.get_context("path");
        REQUIRE(ctx != nullptr);
        REQUIRE(*ctx == "/out/a.yml");
        REQUIRE(err.get_context("missing") == nullptr);
    }
}

TEST_CASE("Error factory methods", "[core][error]") {
    SECTION("LoadError::missing_dependency names the dependency") {
        Error err = LoadError::missing_dependency("pipeforge_yaml", "/bin/libpipeforge_yaml.so");
        REQUIRE(err.code() == ErrorCode::DependencyMissing);
        REQUIRE(err.message().find("pipeforge_yaml") != std::string::npos);
        REQUIRE(err.message().find("/bin/libpipeforge_yaml.so") != std::string::npos);
        REQUIRE(err.as<LoadError>()->dependency == "pipeforge_yaml");
    }

    SECTION("LoadError::missing_artifact") {
        Error err = LoadError::missing_artifact("/bin/libdefs.so");
        REQUIRE(err.code() == ErrorCode::NotFound);
        REQUIRE(err.is<LoadError>());
    }

    SECTION("LoadError::corrupt_artifact") {
        Error err = LoadError::corrupt_artifact("/bin/libdefs.so", "invalid ELF header");
        REQUIRE(err.code() == ErrorCode::CorruptData);
        REQUIRE(err.message().find("invalid ELF header") != std::string::npos);
    }

    SECTION("LoadError::api_mismatch") {
        Error err = LoadError::api_mismatch("/bin/libdefs.so", 1, 7);
        REQUIRE(err.code() == ErrorCode::IncompatibleVersion);
        REQUIRE(err.message().find("expected 1, found 7") != std::string::npos);
    }

    SECTION("DiscoveryError::instantiation_failed") {
        Error err = DiscoveryError::instantiation_failed("ns::Broken", "boom");
        REQUIRE(err.code() == ErrorCode::InvalidState);
        REQUIRE(err.as<DiscoveryError>()->type_name == "ns::Broken");
    }

    SECTION("DefinitionError::validation_failed keeps the reason as message") {
        Error err = DefinitionError::validation_failed("CiPipeline", "pipeline has no jobs");
        REQUIRE(err.code() == ErrorCode::ValidationError);
        REQUIRE(err.message() == "pipeline has no jobs");
    }

    SECTION("ConfigError::missing_required") {
        Error err = ConfigError::missing_required("assembly");
        REQUIRE(err.code() == ErrorCode::InvalidArgument);
        REQUIRE(err.as<ConfigError>()->key == "assembly");
    }

    SECTION("as<T> returns null for other kinds") {
        Error err = ConfigError::unknown_option("--bogus");
        REQUIRE(err.as<LoadError>() == nullptr);
        REQUIRE_FALSE(err.is<DefinitionError>());
    }
}

TEST_CASE("Error chain", "[core][error]") {
    Error err = LoadError::missing_dependency("pipeforge_definitions", "/lib/libpipeforge_definitions.so");
    err.with_context("module", "/lib/libdefs.so");

    auto chain = build_error_chain(err);
    REQUIRE(chain.find("[DependencyMissing]") != std::string::npos);
    REQUIRE(chain.find("[LoadError]") != std::string::npos);
    REQUIRE(chain.find("(dependency: pipeforge_definitions)") != std::string::npos);
    REQUIRE(chain.find("\n  module: /lib/libdefs.so") != std::string::npos);
}

// =============================================================================
// Result<T> Tests
// =============================================================================

TEST_CASE("Result construction", "[core][result]") {
    SECTION("Ok with value") {
        Result<int> r = Ok(42);
        REQUIRE(r.is_ok());
        REQUIRE_FALSE(r.is_err());
        REQUIRE(r.value() == 42);
        REQUIRE(*r == 42);
    }

    SECTION("Err with error") {
        Result<int> r = Err<int>(Error(ErrorCode::NotFound, "nothing here"));
        REQUIRE(r.is_err());
        REQUIRE(r.error().code() == ErrorCode::NotFound);
        REQUIRE(r.value_or(7) == 7);
    }

    SECTION("void results") {
        Result<void> ok = Ok();
        REQUIRE(ok.is_ok());

        Result<void> err = Err(Error("failed"));
        REQUIRE_FALSE(err);
        REQUIRE(err.error().message() == "failed");
    }
}

TEST_CASE("Result combinators", "[core][result]") {
    SECTION("map transforms the value") {
        Result<int> r = Ok(20);
        auto doubled = r.map([](int v) { return v * 2; });
        REQUIRE(doubled.value() == 40);
    }

    SECTION("map passes errors through") {
        Result<int> r = Err<int>(Error("bad"));
        auto mapped = r.map([](int v) { return v + 1; });
        REQUIRE(mapped.is_err());
        REQUIRE(mapped.error().message() == "bad");
    }

    SECTION("and_then chains") {
        Result<int> r = Ok(3);
        auto chained = r.and_then([](int v) -> Result<std::string> {
            return std::string(static_cast<std::size_t>(v), 'x');
        });
        REQUIRE(chained.value() == "xxx");
    }
}
