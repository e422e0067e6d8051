/// @file publisher.cpp
/// @brief Publish orchestration implementation

#include <pipeforge/publish/publisher.hpp>

#include <pipeforge/core/log.hpp>

#include <exception>

namespace pipeforge_publish {

using pipeforge_core::DefinitionError;
using pipeforge_core::DiscoveryError;
using pipeforge_core::Error;
using pipeforge_core::build_error_chain;

namespace {

constexpr const char* VERBOSITY_HINT = "To see error details, run with --verbose";
constexpr const char* UNKNOWN_EXCEPTION = "unknown exception";

DefinitionReport make_report(const pipeforge_module::DefinitionInstance& instance) {
    DefinitionReport report;
    report.name = instance.name;
    report.type_name = instance.type_name;
    return report;
}

} // anonymous namespace

Publisher::Publisher(PublisherConfig config)
    : m_config(std::move(config))
{}

RunResult Publisher::run(const pipeforge_module::TypeCatalog& catalog) const {
    auto logger = pipeforge_core::publish_logger();

    pipeforge_module::DefinitionDiscoverer discoverer(m_config.contract);
    auto instances = discoverer.discover(catalog);
    if (!instances) {
        RunResult result;
        result.fail_if_changed = m_config.fail_if_changed;
        result.fatal = instances.error();
        logger->error("{}", instances.error().message());
        return result;
    }

    if (instances->empty()) {
        RunResult result;
        result.fail_if_changed = m_config.fail_if_changed;
        result.fatal = Error(DiscoveryError::no_definitions(catalog.module_name(), m_config.contract));
        logger->error("{}", result.fatal->message());
        return result;
    }

    // Instances are destroyed here, before the caller can drop the catalog
    return publish_all(*instances);
}

RunResult Publisher::publish_all(const std::vector<pipeforge_module::DefinitionInstance>& instances) const {
    PIPEFORGE_LOG_SCOPE("publish_all", "publish");

    RunResult result;
    result.fail_if_changed = m_config.fail_if_changed;
    result.definitions.reserve(instances.size());

    for (const auto& instance : instances) {
        result.definitions.push_back(publish_one(instance));
    }

    pipeforge_core::publish_logger()->debug(
        "Published {} definition(s): {} created, {} changed, {} unchanged, {} failed validation, {} failed to publish",
        result.definitions.size(),
        result.count(Outcome::Created),
        result.count(Outcome::Changed),
        result.count(Outcome::Unchanged),
        result.count(Outcome::ValidationFailed),
        result.count(Outcome::PublishError));

    return result;
}

DefinitionReport Publisher::publish_one(const pipeforge_module::DefinitionInstance& instance) const {
    auto logger = pipeforge_core::publish_logger();
    auto report = make_report(instance);
    const auto& name = instance.name;

    auto fail = [&](Outcome outcome, const Error& error) {
        report.outcome = outcome;
        report.message = error.message();
        logger->debug("{}", build_error_chain(error));
        return report;
    };

    // 1. Target path
    std::filesystem::path path;
    try {
        auto resolved = instance->target_path();
        if (!resolved) {
            logger->error("Failed to get target path for {}: {}", name, resolved.error().message());
            return fail(Outcome::PublishError, resolved.error());
        }
        path = *resolved;
    } catch (const std::exception& ex) {
        auto error = Error(DefinitionError::invalid_target_path(name, ex.what()));
        logger->error("Failed to get target path for {}: {}", name, ex.what());
        return fail(Outcome::PublishError, error);
    } catch (...) {
        auto error = Error(DefinitionError::invalid_target_path(name, UNKNOWN_EXCEPTION));
        logger->error("Failed to get target path for {}: {}", name, UNKNOWN_EXCEPTION);
        return fail(Outcome::PublishError, error);
    }

    if (path.empty()) {
        auto error = Error(DefinitionError::invalid_target_path(name, "target path is empty"));
        logger->error("Failed to get target path for {}", name);
        return fail(Outcome::PublishError, error);
    }
    report.path = path;

    logger->info("{}:", name);
    logger->info("  Validating pipeline...");

    // 2. Validation
    {
        std::optional<Error> failure;
        try {
            auto validated = instance->validate();
            if (!validated) {
                failure = validated.error();
            }
        } catch (const std::exception& ex) {
            failure = Error(DefinitionError::validation_failed(name, ex.what()));
        } catch (...) {
            failure = Error(DefinitionError::validation_failed(name, UNKNOWN_EXCEPTION));
        }

        if (failure) {
            logger->error("Validation of pipeline {} failed: {}", name, failure->message());
            logger->error("{}", VERBOSITY_HINT);
            return fail(Outcome::ValidationFailed, *failure);
        }
    }

    // 3-5. Fingerprint, publish, fingerprint
    auto before = fingerprint_file(path);

    try {
        auto published = instance->publish();
        if (!published) {
            logger->error("Failed to publish {}: {}", name, published.error().message());
            return fail(Outcome::PublishError, published.error());
        }
    } catch (const std::exception& ex) {
        auto error = Error(DefinitionError::publish_failed(name, ex.what()));
        logger->error("{}", error.message());
        return fail(Outcome::PublishError, error);
    } catch (...) {
        auto error = Error(DefinitionError::publish_failed(name, UNKNOWN_EXCEPTION));
        logger->error("{}", error.message());
        return fail(Outcome::PublishError, error);
    }

    auto after = fingerprint_file(path);
    report.outcome = classify(before, after);

    // 6. Status line
    switch (report.outcome) {
        case Outcome::Created:
            if (m_config.fail_if_changed) {
                logger->error("  This pipeline hasn't been published yet!");
            } else {
                logger->info("  {} created at {}", name, path.string());
            }
            break;
        case Outcome::Unchanged:
            logger->info("  No new changes to publish");
            break;
        case Outcome::Changed:
            if (m_config.fail_if_changed) {
                logger->error("  Changes detected between {} and {}!", name, path.string());
            } else {
                logger->info("  Published new changes to {}", path.string());
            }
            break;
        default:
            break;
    }

    return report;
}

} // namespace pipeforge_publish
