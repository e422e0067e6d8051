/// @file main.cpp
/// @brief pipeforge entry point - publishes pipeline definitions from a compiled module
///
/// Loads the definition module, discovers every pipeline definition in it,
/// validates and publishes each one, and reports drift between the files on
/// disk and what the definitions currently produce.

#include <pipeforge/app/application.hpp>
#include <pipeforge/app/config.hpp>
#include <pipeforge/core/log.hpp>
#include <pipeforge/core/version.hpp>

#include <iostream>

namespace {

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " [OPTIONS] --assembly MODULE\n"
              << "\n"
              << "Arguments:\n"
              << "  MODULE                 Compiled definition module (.so/.dylib/.dll)\n"
              << "\n"
              << "Options:\n"
              << "  --assembly, --module   Module to scan for definitions (required)\n"
              << "  --fail-if-changed      Fail if any published file was created or changed\n"
              << "  --config FILE          Read settings from a TOML file\n"
              << "  --workdir DIR          Resolve target paths relative to DIR\n"
              << "  --report FILE          Write a JSON run report\n"
              << "  --dependency NAME      Library to preload from the module's directory (repeatable)\n"
              << "  --log-level LEVEL      trace, debug, info, warn, error, critical, off\n"
              << "  --log-file FILE        Also log to FILE\n"
              << "  --verbose              Same as --log-level debug\n"
              << "  --help, -h             Show this help message\n"
              << "  --version              Show version information\n"
              << "\n"
              << "Environment:\n"
              << "  PIPEFORGE_ASSEMBLY, PIPEFORGE_FAIL_IF_CHANGED, PIPEFORGE_LOG_LEVEL, ...\n"
              << "\n"
              << "Examples:\n"
              << "  " << program_name << " --assembly build/lib/libmy_pipelines.so\n"
              << "  " << program_name << " --assembly build/lib/libmy_pipelines.so --fail-if-changed\n";
}

void print_version() {
    std::cout << "pipeforge " << pipeforge_core::tool_version().to_string() << "\n"
              << "module API " << PIPEFORGE_MODULE_API_VERSION << "\n";
}

} // anonymous namespace

// =============================================================================
// Main
// =============================================================================

int main(int argc, char** argv) {
    using namespace pipeforge_app;

    ConfigManager config;
    config.setup_defaults();
    config.load_environment();

    auto parsed = config.parse_args(argc, argv);
    if (!parsed) {
        std::cerr << "Error: " << parsed.error().message() << "\n\n";
        print_usage(argv[0]);
        return exit_codes::CONFIG_ERROR;
    }

    if (config.get_bool(config_keys::HELP)) {
        print_usage(argv[0]);
        return exit_codes::SUCCESS;
    }
    if (config.get_bool(config_keys::VERSION)) {
        print_version();
        return exit_codes::SUCCESS;
    }

    auto config_file = config.get_string(config_keys::CONFIG_FILE);
    if (!config_file.empty()) {
        auto loaded = config.load_toml(config_file);
        if (!loaded) {
            std::cerr << "Error: " << pipeforge_core::build_error_chain(loaded.error()) << "\n";
            return exit_codes::CONFIG_ERROR;
        }
    }

    auto settings = config.build_publish_settings();
    if (!settings) {
        std::cerr << "Error: " << settings.error().message() << "\n\n";
        print_usage(argv[0]);
        return exit_codes::CONFIG_ERROR;
    }

    Application app(std::move(*settings));
    int code = app.run();

    pipeforge_core::shutdown_logging();
    return code;
}
