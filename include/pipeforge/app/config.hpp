#pragma once

/// @file config.hpp
/// @brief Layered configuration for the pipeforge tool
///
/// Values are looked up through layers in priority order:
/// - Command-line arguments (highest)
/// - Environment variables (PIPEFORGE_*)
/// - Configuration file (TOML)
/// - Built-in defaults (lowest)

#include <pipeforge/core/error.hpp>
#include <pipeforge/core/log.hpp>
#include <pipeforge/module/module_loader.hpp>

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace pipeforge_app {

/// A configuration value
using ConfigValue = std::variant<
    bool,
    std::int64_t,
    double,
    std::string,
    std::vector<std::string>
>;

/// Parse "true/false", "1/0", "yes/no", "on/off"
[[nodiscard]] std::optional<bool> parse_bool(const std::string& str);

// =============================================================================
// Config Layer
// =============================================================================

/// Configuration layer priority (lower = higher priority)
enum class ConfigLayerPriority : std::int32_t {
    CommandLine = -1000,    ///< Command-line arguments (highest)
    Environment = -500,     ///< Environment variables
    File = 0,               ///< Configuration file
    Default = 1000,         ///< Built-in defaults (lowest)
};

/// A configuration layer
class ConfigLayer {
public:
    explicit ConfigLayer(const std::string& name, ConfigLayerPriority priority = ConfigLayerPriority::File)
        : m_name(name), m_priority(priority) {}

    [[nodiscard]] const std::string& name() const { return m_name; }
    [[nodiscard]] ConfigLayerPriority priority() const { return m_priority; }

    [[nodiscard]] bool contains(const std::string& key) const;
    [[nodiscard]] std::optional<ConfigValue> get(const std::string& key) const;
    void set(const std::string& key, ConfigValue value);

    /// Append to a string array value, creating it if needed
    void append(const std::string& key, const std::string& value);

    bool remove(const std::string& key);
    void clear();

    [[nodiscard]] std::vector<std::string> keys() const;
    [[nodiscard]] std::size_t size() const { return m_values.size(); }
    [[nodiscard]] bool empty() const { return m_values.empty(); }

private:
    std::string m_name;
    ConfigLayerPriority m_priority;
    std::map<std::string, ConfigValue> m_values;
};

// =============================================================================
// Publish Settings
// =============================================================================

/// Everything one run needs, resolved from the merged configuration
struct PublishSettings {
    std::filesystem::path assembly;
    bool fail_if_changed = false;
    std::filesystem::path workdir;   ///< Empty keeps the current directory
    std::filesystem::path report;    ///< Empty disables the JSON report
    pipeforge_core::LogConfig logging;
    pipeforge_module::LoaderConfig loader;
};

// =============================================================================
// Config Manager
// =============================================================================

/// Environment lookup, injectable for tests
using EnvironmentLookup = std::function<std::optional<std::string>(const std::string&)>;

/// Layered configuration manager
class ConfigManager {
public:
    ConfigManager() = default;
    ~ConfigManager() = default;

    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    // =========================================================================
    // Layer Management
    // =========================================================================

    void add_layer(std::unique_ptr<ConfigLayer> layer);

    [[nodiscard]] ConfigLayer* get_layer(const std::string& name);
    [[nodiscard]] const ConfigLayer* get_layer(const std::string& name) const;

    [[nodiscard]] std::size_t layer_count() const { return m_layers.size(); }

    // =========================================================================
    // Value Access (Merged View)
    // =========================================================================

    [[nodiscard]] bool contains(const std::string& key) const;

    /// Value from the highest priority layer that has the key
    [[nodiscard]] std::optional<ConfigValue> get(const std::string& key) const;

    [[nodiscard]] bool get_bool(const std::string& key, bool default_value = false) const;
    [[nodiscard]] std::int64_t get_int(const std::string& key, std::int64_t default_value = 0) const;
    [[nodiscard]] std::string get_string(const std::string& key, const std::string& default_value = "") const;
    [[nodiscard]] std::vector<std::string> get_string_array(
        const std::string& key,
        const std::vector<std::string>& default_value = {}) const;

    /// Set value in a layer, creating the layer if needed
    void set(const std::string& key, ConfigValue value, const std::string& layer_name = "file");

    // =========================================================================
    // Sources
    // =========================================================================

    /// Load a TOML file into a layer
    ///
    /// Nested tables become dotted keys ([log] level = "debug" gives
    /// "log.level").
    pipeforge_core::Result<void> load_toml(const std::filesystem::path& path,
                                           const std::string& layer_name = "file");

    /// Load TOML text into a layer
    pipeforge_core::Result<void> load_toml_string(const std::string& content,
                                                  const std::string& source_name,
                                                  const std::string& layer_name = "file");

    /// Parse command-line arguments (argv[0] is skipped)
    pipeforge_core::Result<void> parse_args(int argc, char** argv);

    /// Parse command-line arguments
    pipeforge_core::Result<void> parse_args(const std::vector<std::string>& args);

    /// Read the PIPEFORGE_* environment variables
    void load_environment();

    /// Read the PIPEFORGE_* variables through a custom lookup
    void load_environment(const EnvironmentLookup& lookup);

    // =========================================================================
    // Defaults
    // =========================================================================

    /// Create the default layers and fill in built-in defaults
    void setup_defaults();

    /// Create default layers (cmdline, environment, file, defaults)
    void create_default_layers();

    // =========================================================================
    // Conversion
    // =========================================================================

    /// Resolve the settings of one run
    ///
    /// Fails with a ConfigError if the assembly is missing or a value
    /// cannot be interpreted.
    [[nodiscard]] pipeforge_core::Result<PublishSettings> build_publish_settings() const;

private:
    /// Layers sorted by priority (highest first)
    [[nodiscard]] std::vector<const ConfigLayer*> sorted_layers() const;

    ConfigLayer& ensure_layer(const std::string& name, ConfigLayerPriority priority);

    std::vector<std::unique_ptr<ConfigLayer>> m_layers;
};

// =============================================================================
// Config Keys (Constants)
// =============================================================================

namespace config_keys {

constexpr const char* ASSEMBLY = "assembly";
constexpr const char* FAIL_IF_CHANGED = "fail_if_changed";
constexpr const char* CONFIG_FILE = "config";
constexpr const char* WORKDIR = "workdir";
constexpr const char* REPORT = "report";
constexpr const char* LOG_LEVEL = "log.level";
constexpr const char* LOG_FILE = "log.file";
constexpr const char* LOADER_DEPENDENCIES = "loader.dependencies";
constexpr const char* HELP = "help";
constexpr const char* VERSION = "version";

} // namespace config_keys

} // namespace pipeforge_app
