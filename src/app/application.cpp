/// @file application.cpp
/// @brief Application run implementation

#include <pipeforge/app/application.hpp>

#include <pipeforge/core/log.hpp>
#include <pipeforge/module/module_loader.hpp>
#include <pipeforge/publish/publisher.hpp>
#include <pipeforge/publish/report.hpp>

namespace pipeforge_app {

using pipeforge_core::ConfigError;
using pipeforge_core::Error;

namespace {

std::filesystem::path absolute_or_empty(const std::filesystem::path& path) {
    if (path.empty()) {
        return path;
    }
    std::error_code ec;
    auto result = std::filesystem::absolute(path, ec);
    return ec ? path : result;
}

} // anonymous namespace

Application::Application(PublishSettings settings)
    : m_settings(std::move(settings))
{
    m_settings.assembly = absolute_or_empty(m_settings.assembly);
    m_settings.report = absolute_or_empty(m_settings.report);
}

pipeforge_publish::RunResult Application::execute() {
    auto logger = pipeforge_core::core_logger();
    PIPEFORGE_LOG_SCOPE("execute", "pipeforge");

    pipeforge_publish::RunResult result;
    result.fail_if_changed = m_settings.fail_if_changed;

    if (!m_settings.workdir.empty()) {
        std::error_code ec;
        std::filesystem::current_path(m_settings.workdir, ec);
        if (ec) {
            result.fatal = Error(ConfigError::invalid_value("workdir", m_settings.workdir.string()))
                .with_context("reason", ec.message());
            logger->error("Cannot change to {}: {}", m_settings.workdir.string(), ec.message());
            return result;
        }
        logger->debug("Working directory: {}", m_settings.workdir.string());
    }

    pipeforge_module::ModuleLoader loader(m_settings.loader);
    auto catalog = loader.load(m_settings.assembly);
    if (!catalog) {
        result.fatal = catalog.error();
        logger->error("{}", catalog.error().message());
        logger->debug("{}", pipeforge_core::build_error_chain(catalog.error()));
        return result;
    }

    pipeforge_publish::PublisherConfig publisher_config;
    publisher_config.fail_if_changed = m_settings.fail_if_changed;

    pipeforge_publish::Publisher publisher(publisher_config);
    return publisher.run(*catalog);
}

int Application::run() {
    pipeforge_core::configure_logging(m_settings.logging);
    auto logger = pipeforge_core::core_logger();

    auto result = execute();

    if (!m_settings.report.empty()) {
        auto written = pipeforge_publish::write_report(result, m_settings.report);
        if (!written) {
            logger->error("{}", written.error().message());
        } else {
            logger->debug("Report written to {}", m_settings.report.string());
        }
    }

    if (result.success()) {
        logger->debug("Run succeeded");
    } else if (!result.fatal && result.has_drift()) {
        logger->error("Published definitions were out of date");
    }

    pipeforge_core::flush_all_loggers();
    return result.success() ? exit_codes::SUCCESS : exit_codes::RUN_FAILED;
}

} // namespace pipeforge_app
