// pipeforge_yaml emitter tests

#include <catch2/catch_test_macros.hpp>
#include <pipeforge/yaml/emitter.hpp>

#include <yaml-cpp/yaml.h>

using namespace pipeforge_model;
using pipeforge_yaml::to_yaml;

namespace {

Pipeline sample_pipeline() {
    Pipeline p;
    p.name = "$(Date:yyyyMMdd)$(Rev:.r)";
    p.trigger_branches = {"main", "release/*"};
    p.pr_branches = {"main"};
    p.variables = {{"Configuration", "Release"}, {"Verbosity", "minimal"}};

    Job build;
    build.name = "build";
    build.display_name = "Build";
    build.pool_image = "ubuntu-latest";
    build.steps.push_back(bash({"./configure", "make"}, "Compile"));

    Job test;
    test.name = "test";
    test.depends_on = {"build"};
    test.steps.push_back(bash_file("eng/test.sh", std::string("--all")));

    p.jobs.push_back(std::move(build));
    p.jobs.push_back(std::move(test));
    return p;
}

/// Literal blocks load back with their final line break
std::string script_of(const YAML::Node& step) {
    auto script = step["bash"].as<std::string>();
    while (!script.empty() && script.back() == '\n') {
        script.pop_back();
    }
    return script;
}

} // anonymous namespace

TEST_CASE("Pipeline documents", "[yaml][emitter]") {
    auto text = to_yaml(sample_pipeline());
    auto doc = YAML::Load(text);

    SECTION("ends with a newline") {
        REQUIRE_FALSE(text.empty());
        REQUIRE(text.back() == '\n');
    }

    SECTION("top-level fields in order") {
        auto name_pos = text.find("name:");
        auto trigger_pos = text.find("trigger:");
        auto pr_pos = text.find("pr:");
        auto variables_pos = text.find("variables:");
        auto jobs_pos = text.find("jobs:");
        REQUIRE(name_pos < trigger_pos);
        REQUIRE(trigger_pos < pr_pos);
        REQUIRE(pr_pos < variables_pos);
        REQUIRE(variables_pos < jobs_pos);
    }

    SECTION("triggers") {
        REQUIRE(doc["trigger"]["branches"]["include"].size() == 2);
        REQUIRE(doc["trigger"]["branches"]["include"][1].as<std::string>() == "release/*");
        REQUIRE(doc["pr"]["branches"]["include"][0].as<std::string>() == "main");
    }

    SECTION("variables keep their order") {
        REQUIRE(doc["variables"].size() == 2);
        REQUIRE(doc["variables"][0]["name"].as<std::string>() == "Configuration");
        REQUIRE(doc["variables"][1]["value"].as<std::string>() == "minimal");
    }

    SECTION("jobs") {
        const auto jobs = doc["jobs"];
        REQUIRE(jobs.size() == 2);
        REQUIRE(jobs[0]["job"].as<std::string>() == "build");
        REQUIRE(jobs[0]["displayName"].as<std::string>() == "Build");
        REQUIRE(jobs[0]["pool"]["vmImage"].as<std::string>() == "ubuntu-latest");
        REQUIRE(jobs[1]["dependsOn"][0].as<std::string>() == "build");
        REQUIRE_FALSE(jobs[1]["pool"].IsDefined());
    }

    SECTION("inline scripts keep their lines") {
        const auto step = doc["jobs"][0]["steps"][0];
        REQUIRE(script_of(step) == "./configure\nmake");
        REQUIRE(step["displayName"].as<std::string>() == "Compile");
    }

    SECTION("file steps") {
        const auto step = doc["jobs"][1]["steps"][0];
        REQUIRE(step["bash"].as<std::string>() == "eng/test.sh");
        REQUIRE(step["arguments"].as<std::string>() == "--all");
    }
}

TEST_CASE("Pipeline defaults", "[yaml][emitter]") {
    Pipeline p;
    Job job;
    job.name = "only";
    job.steps.push_back(bash({"true"}));
    p.jobs.push_back(std::move(job));

    auto text = to_yaml(p);
    auto doc = YAML::Load(text);

    REQUIRE(doc["trigger"].as<std::string>() == "none");
    REQUIRE_FALSE(doc["name"].IsDefined());
    REQUIRE_FALSE(doc["pr"].IsDefined());
    REQUIRE_FALSE(doc["variables"].IsDefined());
}

TEST_CASE("Step fields", "[yaml][emitter]") {
    SECTION("defaults are omitted") {
        auto doc = YAML::Load(to_yaml(bash({"make"})));
        REQUIRE(doc.size() == 1);
        REQUIRE(script_of(doc) == "make");
    }

    SECTION("non-default values are written") {
        auto step = bash({"make"});
        step.name = "compile";
        step.condition = "succeeded()";
        step.continue_on_error = true;
        step.enabled = false;
        step.timeout_in_minutes = 30;
        step.env = {{"CC", "clang"}, {"CXX", "clang++"}};
        step.shell().working_directory = "src";
        step.shell().fail_on_stderr = true;
        step.shell().no_profile = true;
        step.shell().no_rc = false;

        auto text = to_yaml(step);
        auto doc = YAML::Load(text);

        REQUIRE(doc["name"].as<std::string>() == "compile");
        REQUIRE(doc["condition"].as<std::string>() == "succeeded()");
        REQUIRE(doc["continueOnError"].as<bool>());
        REQUIRE_FALSE(doc["enabled"].as<bool>());
        REQUIRE(doc["timeoutInMinutes"].as<int>() == 30);
        REQUIRE(doc["workingDirectory"].as<std::string>() == "src");
        REQUIRE(doc["failOnStderr"].as<bool>());
        REQUIRE(doc["noProfile"].as<bool>());
        REQUIRE_FALSE(doc["noRc"].as<bool>());
        REQUIRE(doc["env"]["CXX"].as<std::string>() == "clang++");

        // env comes after the shell options and before noRc
        REQUIRE(text.find("noProfile:") < text.find("env:"));
        REQUIRE(text.find("env:") < text.find("noRc:"));
    }
}

TEST_CASE("Rendering is deterministic", "[yaml][emitter]") {
    REQUIRE(to_yaml(sample_pipeline()) == to_yaml(sample_pipeline()));
}
