#pragma once

/// @file application.hpp
/// @brief One pipeforge run, from settings to exit code

#include "config.hpp"

#include <pipeforge/publish/outcome.hpp>

namespace pipeforge_app {

/// Process exit codes
namespace exit_codes {
constexpr int SUCCESS = 0;
constexpr int RUN_FAILED = 1;
constexpr int CONFIG_ERROR = 2;
} // namespace exit_codes

/// Loads the configured module and publishes its definitions
class Application {
public:
    explicit Application(PublishSettings settings);

    /// Configure logging, execute, write the report and map the verdict
    /// to an exit code
    [[nodiscard]] int run();

    /// Load, discover and publish
    ///
    /// The assembly and report paths are resolved against the directory the
    /// process started in, before switching to the configured workdir.
    [[nodiscard]] pipeforge_publish::RunResult execute();

    [[nodiscard]] const PublishSettings& settings() const noexcept { return m_settings; }

private:
    PublishSettings m_settings;
};

} // namespace pipeforge_app
