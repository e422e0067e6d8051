/// @file log.cpp
/// @brief Logging system implementation for pipeforge_core
///
/// Extends the spdlog-based logging with:
/// - Named loggers for the loader and publish subsystems
/// - A single shared file sink for all loggers
/// - Log level parsing for the command line and config files

#include <pipeforge/core/log.hpp>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace pipeforge_core {

// =============================================================================
// Logger Registry
// =============================================================================

namespace {

struct LoggerRegistry {
    std::mutex mutex;
    std::map<std::string, std::shared_ptr<spdlog::logger>> loggers;
    spdlog::level::level_enum global_level = spdlog::level::info;
    bool console_enabled = true;
    spdlog::sink_ptr console_sink;
    spdlog::sink_ptr file_sink;
};

LoggerRegistry& get_registry() {
    static LoggerRegistry registry;
    return registry;
}

/// Sinks are shared between loggers so that lines stay ordered
std::vector<spdlog::sink_ptr> create_sinks(LoggerRegistry& reg) {
    std::vector<spdlog::sink_ptr> sinks;

    if (reg.console_enabled) {
        if (!reg.console_sink) {
            reg.console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            reg.console_sink->set_pattern("[%H:%M:%S.%e] [%^%l%$] [%n] %v");
        }
        sinks.push_back(reg.console_sink);
    }

    if (reg.file_sink) {
        sinks.push_back(reg.file_sink);
    }

    return sinks;
}

} // anonymous namespace

// =============================================================================
// Logger Configuration
// =============================================================================

void configure_logging(const LogConfig& config) {
    auto& reg = get_registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    reg.console_enabled = config.console_enabled;
    reg.global_level = config.level;
    reg.file_sink.reset();

    if (config.file_enabled && !config.log_file.empty()) {
        try {
            auto parent = std::filesystem::path(config.log_file).parent_path();
            if (!parent.empty()) {
                std::filesystem::create_directories(parent);
            }
            reg.file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.log_file,
                config.max_file_size,
                config.max_files);
            reg.file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");
        } catch (const spdlog::spdlog_ex& ex) {
            spdlog::warn("Failed to open log file '{}': {}", config.log_file, ex.what());
        } catch (const std::filesystem::filesystem_error& ex) {
            spdlog::warn("Failed to create log directory for '{}': {}", config.log_file, ex.what());
        }
    }

    for (auto& [name, logger] : reg.loggers) {
        logger->sinks() = create_sinks(reg);
        logger->set_level(reg.global_level);
    }

    spdlog::set_level(reg.global_level);
}

std::shared_ptr<spdlog::logger> get_logger(const std::string& name) {
    auto& reg = get_registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    auto it = reg.loggers.find(name);
    if (it != reg.loggers.end()) {
        return it->second;
    }

    auto sinks = create_sinks(reg);
    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(reg.global_level);

    reg.loggers[name] = logger;
    if (!spdlog::get(name)) {
        spdlog::register_logger(logger);
    }

    return logger;
}

std::shared_ptr<spdlog::logger> core_logger() {
    static std::shared_ptr<spdlog::logger> logger = get_logger("pipeforge");
    return logger;
}

std::shared_ptr<spdlog::logger> loader_logger() {
    static std::shared_ptr<spdlog::logger> logger = get_logger("loader");
    return logger;
}

std::shared_ptr<spdlog::logger> publish_logger() {
    static std::shared_ptr<spdlog::logger> logger = get_logger("publish");
    return logger;
}

// =============================================================================
// Log Level Management
// =============================================================================

void set_global_log_level(spdlog::level::level_enum level) {
    auto& reg = get_registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    reg.global_level = level;
    spdlog::set_level(level);

    for (auto& [name, logger] : reg.loggers) {
        logger->set_level(level);
    }
}

spdlog::level::level_enum get_global_log_level() {
    auto& reg = get_registry();
    std::lock_guard<std::mutex> lock(reg.mutex);
    return reg.global_level;
}

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str) {
    if (str == "trace") return spdlog::level::trace;
    if (str == "debug") return spdlog::level::debug;
    if (str == "info") return spdlog::level::info;
    if (str == "warn" || str == "warning") return spdlog::level::warn;
    if (str == "error" || str == "err") return spdlog::level::err;
    if (str == "critical" || str == "fatal") return spdlog::level::critical;
    if (str == "off") return spdlog::level::off;
    return std::nullopt;
}

const char* log_level_name(spdlog::level::level_enum level) {
    switch (level) {
        case spdlog::level::trace: return "trace";
        case spdlog::level::debug: return "debug";
        case spdlog::level::info: return "info";
        case spdlog::level::warn: return "warn";
        case spdlog::level::err: return "error";
        case spdlog::level::critical: return "critical";
        case spdlog::level::off: return "off";
        default: return "unknown";
    }
}

// =============================================================================
// Log Scoping
// =============================================================================

LogScope::LogScope(const std::string& name, const std::string& logger_name)
    : m_name(name)
    , m_logger(get_logger(logger_name))
    , m_start(std::chrono::steady_clock::now())
{
    m_logger->trace(">>> Entering {}", m_name);
}

LogScope::~LogScope() {
    auto end = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end - m_start);
    m_logger->trace("<<< Exiting {} ({}ms)", m_name, duration.count());
}

// =============================================================================
// Logging Shutdown
// =============================================================================

void flush_all_loggers() {
    auto& reg = get_registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    for (auto& [name, logger] : reg.loggers) {
        logger->flush();
    }
    spdlog::default_logger()->flush();
}

void shutdown_logging() {
    flush_all_loggers();

    auto& reg = get_registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    for (auto& [name, logger] : reg.loggers) {
        spdlog::drop(name);
    }
    reg.loggers.clear();
    reg.file_sink.reset();

    spdlog::shutdown();
}

} // namespace pipeforge_core
