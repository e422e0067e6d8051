// pipeforge_publish outcome and verdict tests

#include <catch2/catch_test_macros.hpp>
#include <pipeforge/publish/outcome.hpp>

using namespace pipeforge_publish;

namespace {

RunResult result_with(std::initializer_list<Outcome> outcomes, bool fail_if_changed) {
    RunResult result;
    result.fail_if_changed = fail_if_changed;
    for (auto outcome : outcomes) {
        DefinitionReport report;
        report.name = outcome_name(outcome);
        report.outcome = outcome;
        result.definitions.push_back(report);
    }
    return result;
}

} // anonymous namespace

TEST_CASE("Outcome classification", "[publish][outcome]") {
    auto a = fingerprint_bytes("a");
    auto b = fingerprint_bytes("b");

    REQUIRE(classify(std::nullopt, a) == Outcome::Created);
    REQUIRE(classify(a, a) == Outcome::Unchanged);
    REQUIRE(classify(a, b) == Outcome::Changed);

    // A file that vanished after publishing still counts as a change
    REQUIRE(classify(a, std::nullopt) == Outcome::Changed);
}

TEST_CASE("Outcome names", "[publish][outcome]") {
    REQUIRE(std::string(outcome_name(Outcome::ValidationFailed)) == "validation_failed");
    REQUIRE(std::string(outcome_name(Outcome::Created)) == "created");
    REQUIRE(std::string(outcome_name(Outcome::Unchanged)) == "unchanged");
    REQUIRE(std::string(outcome_name(Outcome::Changed)) == "changed");
    REQUIRE(std::string(outcome_name(Outcome::PublishError)) == "publish_error");
}

TEST_CASE("Run verdict", "[publish][outcome]") {
    SECTION("drift fails only in strict mode") {
        for (auto drift : {Outcome::Created, Outcome::Changed}) {
            REQUIRE(result_with({Outcome::Unchanged, drift}, false).success());
            REQUIRE_FALSE(result_with({Outcome::Unchanged, drift}, true).success());
        }
    }

    SECTION("unchanged runs pass in strict mode") {
        REQUIRE(result_with({Outcome::Unchanged, Outcome::Unchanged}, true).success());
    }

    SECTION("per-definition errors do not fail the run") {
        REQUIRE(result_with({Outcome::ValidationFailed, Outcome::PublishError}, false).success());
        REQUIRE(result_with({Outcome::ValidationFailed, Outcome::Unchanged}, true).success());
    }

    SECTION("fatal errors always fail") {
        auto result = result_with({}, false);
        result.fatal = pipeforge_core::Error("module failed to load");
        REQUIRE_FALSE(result.success());
    }

    SECTION("counts") {
        auto result = result_with({Outcome::Created, Outcome::Created, Outcome::Changed}, false);
        REQUIRE(result.count(Outcome::Created) == 2);
        REQUIRE(result.count(Outcome::Changed) == 1);
        REQUIRE(result.count(Outcome::Unchanged) == 0);
        REQUIRE(result.has_drift());
        REQUIRE_FALSE(result_with({Outcome::Unchanged}, false).has_drift());
    }
}
