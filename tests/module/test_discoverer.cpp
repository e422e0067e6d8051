// pipeforge_module DefinitionDiscoverer tests

#include <catch2/catch_test_macros.hpp>
#include <pipeforge/definition/registration.hpp>
#include <pipeforge/module/discoverer.hpp>

#include <stdexcept>

using namespace pipeforge_module;
using pipeforge_definition::ModuleRegistry;
using pipeforge_definition::PipelineDefinition;

namespace {

// =============================================================================
// Test Definitions
// =============================================================================

class SimplePipeline : public PipelineDefinition {
    PIPEFORGE_TYPE(SimplePipeline, "discovery_test::SimplePipeline", PipelineDefinition)

protected:
    std::string target_file() const override { return "simple.yml"; }
    pipeforge_model::Pipeline pipeline() const override { return {}; }
};

class LayeredBase : public PipelineDefinition {
    PIPEFORGE_TYPE(LayeredBase, "discovery_test::LayeredBase", PipelineDefinition)

protected:
    pipeforge_model::Pipeline pipeline() const override { return {}; }
};

class DeepPipeline : public LayeredBase {
    PIPEFORGE_TYPE(DeepPipeline, "discovery_test::DeepPipeline", LayeredBase)

protected:
    std::string target_file() const override { return "deep.yml"; }
};

class Unrelated : public pipeforge_definition::IDefinition {
    PIPEFORGE_TYPE(Unrelated, "discovery_test::Unrelated", pipeforge_definition::IDefinition)

public:
    pipeforge_definition::Result<std::filesystem::path> target_path() const override {
        return std::filesystem::path("unrelated.txt");
    }
    pipeforge_definition::Result<void> validate() const override { return pipeforge_core::Ok(); }
    pipeforge_definition::Result<void> publish() const override { return pipeforge_core::Ok(); }
};

class ExplodingPipeline : public PipelineDefinition {
    PIPEFORGE_TYPE(ExplodingPipeline, "discovery_test::ExplodingPipeline", PipelineDefinition)

public:
    ExplodingPipeline() { throw std::runtime_error("constructor exploded"); }

protected:
    std::string target_file() const override { return "exploding.yml"; }
    pipeforge_model::Pipeline pipeline() const override { return {}; }
};

class ForeignThrowingPipeline : public PipelineDefinition {
    PIPEFORGE_TYPE(ForeignThrowingPipeline, "discovery_test::ForeignThrowingPipeline", PipelineDefinition)

public:
    ForeignThrowingPipeline() { throw 7; }

protected:
    std::string target_file() const override { return "foreign.yml"; }
    pipeforge_model::Pipeline pipeline() const override { return {}; }
};

class RenamedPipeline : public PipelineDefinition {
    PIPEFORGE_TYPE(RenamedPipeline, "discovery_test::RenamedPipeline", PipelineDefinition)

public:
    std::string name() const override { return "Release (nightly)"; }

protected:
    std::string target_file() const override { return "renamed.yml"; }
    pipeforge_model::Pipeline pipeline() const override { return {}; }
};

// Only the leaf is ever registered; both intermediates stay implicit
class UnlistedStage : public PipelineDefinition {
    PIPEFORGE_TYPE(UnlistedStage, "discovery_test::UnlistedStage", PipelineDefinition)
};

class UnlistedLayer : public UnlistedStage {
    PIPEFORGE_TYPE(UnlistedLayer, "discovery_test::UnlistedLayer", UnlistedStage)

protected:
    pipeforge_model::Pipeline pipeline() const override { return {}; }
};

class ListedLeaf : public UnlistedLayer {
    PIPEFORGE_TYPE(ListedLeaf, "discovery_test::ListedLeaf", UnlistedLayer)

protected:
    std::string target_file() const override { return "leaf.yml"; }
};

/// Types normally provided by the definitions library
std::vector<TypeEntry> base_entries() {
    static ModuleRegistry registry("pipeforge_definitions");
    if (registry.size() == 0) {
        registry.add_abstract<pipeforge_definition::IDefinition>();
        registry.add_abstract<pipeforge_definition::DefinitionBase>();
        registry.add_abstract<PipelineDefinition>();
    }
    return TypeCatalog::entries_of(*registry.view());
}

ModuleRegistry& test_registry() {
    static ModuleRegistry registry("discovery_test");
    if (registry.size() == 0) {
        registry.add_definition<SimplePipeline>();
        registry.add_abstract<LayeredBase>();
        registry.add_definition<DeepPipeline>();
        registry.add_definition<Unrelated>();
    }
    return registry;
}

TypeCatalog test_catalog() {
    return TypeCatalog::from_view(*test_registry().view(), base_entries());
}

} // anonymous namespace

TEST_CASE("is_definition_type", "[module][discovery]") {
    auto catalog = test_catalog();
    const std::string contract = pipeforge_definition::DefinitionBase::qualified_type_name();

    REQUIRE(is_definition_type(*catalog.find("discovery_test::SimplePipeline"), contract));
    REQUIRE(is_definition_type(*catalog.find("discovery_test::DeepPipeline"), contract));
    REQUIRE_FALSE(is_definition_type(*catalog.find("discovery_test::LayeredBase"), contract));
    REQUIRE_FALSE(is_definition_type(*catalog.find("discovery_test::Unrelated"), contract));
}

TEST_CASE("DefinitionDiscoverer finds concrete descendants", "[module][discovery]") {
    auto catalog = test_catalog();
    DefinitionDiscoverer discoverer;

    SECTION("default contract is DefinitionBase") {
        REQUIRE(discoverer.contract() == "pipeforge_definition::DefinitionBase");
    }

    SECTION("any ancestor depth, catalog order") {
        auto types = discoverer.find_types(catalog);
        REQUIRE(types.size() == 2);
        REQUIRE(types[0]->qualified_name == "discovery_test::SimplePipeline");
        REQUIRE(types[1]->qualified_name == "discovery_test::DeepPipeline");
    }

    SECTION("one instance per type") {
        auto instances = discoverer.discover(catalog);
        REQUIRE(instances.is_ok());
        REQUIRE(instances->size() == 2);

        const auto& deep = (*instances)[1];
        REQUIRE(deep.type_name == "discovery_test::DeepPipeline");
        REQUIRE(deep.name == "DeepPipeline");
        REQUIRE(std::string(deep->type_name()) == "discovery_test::DeepPipeline");
        REQUIRE(deep->target_path().value() == std::filesystem::path("deep.yml"));
    }

    SECTION("a different contract") {
        DefinitionDiscoverer layered("discovery_test::LayeredBase");
        auto types = layered.find_types(catalog);
        REQUIRE(types.size() == 1);
        REQUIRE(types[0]->qualified_name == "discovery_test::DeepPipeline");
    }

    SECTION("typed contract") {
        auto instances = discover<pipeforge_definition::IDefinition>(catalog);
        REQUIRE(instances.is_ok());
        REQUIRE(instances->size() == 3);
    }

    SECTION("no matches is not an error here") {
        DefinitionDiscoverer none("discovery_test::NothingDerivesFromThis");
        auto instances = none.discover(catalog);
        REQUIRE(instances.is_ok());
        REQUIRE(instances->empty());
    }
}

TEST_CASE("DefinitionDiscoverer finds leaves of unregistered bases", "[module][discovery]") {
    ModuleRegistry registry("leaf_only");
    registry.add_definition<ListedLeaf>();
    auto catalog = TypeCatalog::from_view(*registry.view(), base_entries());

    const auto* leaf = catalog.find("discovery_test::ListedLeaf");
    REQUIRE(leaf != nullptr);
    REQUIRE(leaf->ancestors == std::vector<std::string>{
        "discovery_test::UnlistedLayer",
        "discovery_test::UnlistedStage",
        "pipeforge_definition::PipelineDefinition",
        "pipeforge_definition::DefinitionBase",
        "pipeforge_definition::IDefinition",
    });

    auto instances = DefinitionDiscoverer().discover(catalog);
    REQUIRE(instances.is_ok());
    REQUIRE(instances->size() == 1);
    REQUIRE((*instances)[0].type_name == "discovery_test::ListedLeaf");
}

TEST_CASE("DefinitionDiscoverer uses the definition's own name", "[module][discovery]") {
    ModuleRegistry registry("renamed");
    registry.add_definition<RenamedPipeline>();
    auto catalog = TypeCatalog::from_view(*registry.view(), base_entries());

    auto instances = DefinitionDiscoverer().discover(catalog);
    REQUIRE(instances.is_ok());
    REQUIRE((*instances)[0].name == "Release (nightly)");
    REQUIRE((*instances)[0].name == make_instance<RenamedPipeline>().name);
}

TEST_CASE("DefinitionDiscoverer instantiation failures", "[module][discovery]") {
    SECTION("constructor throwing a non-standard exception") {
        ModuleRegistry registry("foreign");
        registry.add_definition<ForeignThrowingPipeline>();
        auto catalog = TypeCatalog::from_view(*registry.view(), base_entries());

        auto instances = DefinitionDiscoverer().discover(catalog);
        REQUIRE(instances.is_err());
        REQUIRE(instances.error().as<pipeforge_core::DiscoveryError>()->kind ==
                pipeforge_core::DiscoveryError::Kind::InstantiationFailed);
        REQUIRE(instances.error().message().find("unknown exception") != std::string::npos);
    }

    SECTION("throwing constructor fails discovery") {
        ModuleRegistry registry("exploding");
        registry.add_definition<SimplePipeline>();
        registry.add_definition<ExplodingPipeline>();
        auto catalog = TypeCatalog::from_view(*registry.view(), base_entries());

        auto instances = DefinitionDiscoverer().discover(catalog);
        REQUIRE(instances.is_err());

        const auto* err = instances.error().as<pipeforge_core::DiscoveryError>();
        REQUIRE(err != nullptr);
        REQUIRE(err->kind == pipeforge_core::DiscoveryError::Kind::InstantiationFailed);
        REQUIRE(err->type_name == "discovery_test::ExplodingPipeline");
        REQUIRE(instances.error().message().find("constructor exploded") != std::string::npos);
    }

    SECTION("type without factory") {
        TypeDescriptor desc;
        desc.qualified_name = "discovery_test::Abstract";
        auto instance = DefinitionDiscoverer::instantiate(desc);
        REQUIRE(instance.is_err());
        REQUIRE(instance.error().message().find("no factory") != std::string::npos);
    }

    SECTION("factory returning null") {
        TypeDescriptor desc;
        desc.qualified_name = "discovery_test::Null";
        desc.create = []() -> pipeforge_definition::IDefinition* { return nullptr; };
        desc.destroy = [](pipeforge_definition::IDefinition* def) { delete def; };
        auto instance = DefinitionDiscoverer::instantiate(desc);
        REQUIRE(instance.is_err());
    }
}

TEST_CASE("make_instance", "[module][discovery]") {
    auto instance = make_instance<SimplePipeline>();
    REQUIRE(instance.type_name == "discovery_test::SimplePipeline");
    REQUIRE(instance.name == "SimplePipeline");
    REQUIRE(instance.definition != nullptr);
}
