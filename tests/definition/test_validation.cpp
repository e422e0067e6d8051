// pipeforge_definition pipeline validation tests

#include <catch2/catch_test_macros.hpp>
#include <pipeforge/definition/definition.hpp>

using namespace pipeforge_definition;
using namespace pipeforge_model;

namespace {

Pipeline valid_pipeline() {
    Pipeline p;

    Job build;
    build.name = "build";
    build.steps.push_back(bash({"make"}));

    Job test;
    test.name = "test";
    test.depends_on = {"build"};
    test.steps.push_back(bash_file("eng/test.sh"));

    p.jobs.push_back(std::move(build));
    p.jobs.push_back(std::move(test));
    return p;
}

bool has_problem(const std::vector<std::string>& problems, const std::string& text) {
    for (const auto& problem : problems) {
        if (problem == text) {
            return true;
        }
    }
    return false;
}

} // anonymous namespace

TEST_CASE("Valid pipelines", "[definition][validation]") {
    auto p = valid_pipeline();
    REQUIRE(pipeline_problems(p).empty());
    REQUIRE(validate_pipeline(p).is_ok());
}

TEST_CASE("Pipeline problems", "[definition][validation]") {
    SECTION("no jobs") {
        auto problems = pipeline_problems(Pipeline{});
        REQUIRE(problems == std::vector<std::string>{"pipeline has no jobs"});
    }

    SECTION("unnamed job") {
        auto p = valid_pipeline();
        p.jobs[0].name.clear();
        p.jobs[1].depends_on.clear();
        REQUIRE(has_problem(pipeline_problems(p), "job #1 has no name"));
    }

    SECTION("duplicate job names") {
        auto p = valid_pipeline();
        p.jobs[1].name = "build";
        p.jobs[1].depends_on.clear();
        REQUIRE(has_problem(pipeline_problems(p), "duplicate job name 'build'"));
    }

    SECTION("job without steps") {
        auto p = valid_pipeline();
        p.jobs[1].steps.clear();
        REQUIRE(has_problem(pipeline_problems(p), "job 'test' has no steps"));
    }

    SECTION("empty inline script") {
        auto p = valid_pipeline();
        p.jobs[0].steps.push_back(Step{});
        REQUIRE(has_problem(pipeline_problems(p), "job 'build' step #2 has an empty script"));
    }

    SECTION("negative timeout") {
        auto p = valid_pipeline();
        p.jobs[0].steps[0].timeout_in_minutes = -5;
        REQUIRE(has_problem(pipeline_problems(p), "job 'build' step #1 has a negative timeout"));
    }

    SECTION("unknown dependency") {
        auto p = valid_pipeline();
        p.jobs[1].depends_on = {"package"};
        REQUIRE(has_problem(pipeline_problems(p), "job 'test' depends on unknown job 'package'"));
    }
}

TEST_CASE("validate_pipeline reports every problem", "[definition][validation]") {
    auto p = valid_pipeline();
    p.jobs[0].steps.clear();
    p.jobs[1].depends_on = {"deploy"};

    auto result = validate_pipeline(p, "Release");
    REQUIRE(result.is_err());
    REQUIRE(result.error().message() ==
            "job 'build' has no steps; job 'test' depends on unknown job 'deploy'");
    REQUIRE(result.error().code() == pipeforge_core::ErrorCode::ValidationError);
    REQUIRE(result.error().as<pipeforge_core::DefinitionError>()->definition == "Release");
}

TEST_CASE("Bash task construction", "[definition][model]") {
    SECTION("inline lines are joined") {
        InlineBashTask task{"set -e", "make", "make test"};
        REQUIRE(task.contents == "set -e\nmake\nmake test");
        REQUIRE(task.no_rc);
        REQUIRE_FALSE(task.fail_on_stderr);
    }

    SECTION("file task requires a path") {
        REQUIRE_THROWS_AS(BashFileTask(""), std::invalid_argument);
        BashFileTask task("eng/build.sh", std::string("--release"));
        REQUIRE(task.arguments == std::optional<std::string>("--release"));
    }

    SECTION("steps expose their shell options") {
        auto step = bash_file("eng/build.sh");
        REQUIRE_FALSE(step.is_inline());
        step.shell().working_directory = "src";
        REQUIRE(std::get<BashFileTask>(step.task).working_directory == std::optional<std::string>("src"));
    }
}
