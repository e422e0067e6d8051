/// @file config.cpp
/// @brief Configuration system implementation for pipeforge

#include <pipeforge/app/config.hpp>

#include <toml++/toml.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace pipeforge_app {

using pipeforge_core::ConfigError;
using pipeforge_core::Error;
using pipeforge_core::Ok;
using pipeforge_core::Result;

namespace {

std::vector<std::string> split_list(const std::string& value) {
    std::vector<std::string> items;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        auto first = item.find_first_not_of(" \t");
        auto last = item.find_last_not_of(" \t");
        if (first != std::string::npos) {
            items.push_back(item.substr(first, last - first + 1));
        }
    }
    return items;
}

// =============================================================================
// Command-Line Options
// =============================================================================

enum class OptionKind : std::uint8_t {
    Value,   ///< --key value / --key=value
    Flag,    ///< --key / --key=false
    Append,  ///< Repeatable, collected into a string array
};

struct OptionSpec {
    const char* name;
    const char* key;
    OptionKind kind;
};

constexpr OptionSpec OPTIONS[] = {
    {"assembly", config_keys::ASSEMBLY, OptionKind::Value},
    {"module", config_keys::ASSEMBLY, OptionKind::Value},
    {"fail-if-changed", config_keys::FAIL_IF_CHANGED, OptionKind::Flag},
    {"config", config_keys::CONFIG_FILE, OptionKind::Value},
    {"workdir", config_keys::WORKDIR, OptionKind::Value},
    {"report", config_keys::REPORT, OptionKind::Value},
    {"log-level", config_keys::LOG_LEVEL, OptionKind::Value},
    {"log-file", config_keys::LOG_FILE, OptionKind::Value},
    {"dependency", config_keys::LOADER_DEPENDENCIES, OptionKind::Append},
    {"help", config_keys::HELP, OptionKind::Flag},
    {"version", config_keys::VERSION, OptionKind::Flag},
};

const OptionSpec* find_option(const std::string& name) {
    for (const auto& spec : OPTIONS) {
        if (name == spec.name) {
            return &spec;
        }
    }
    return nullptr;
}

// =============================================================================
// Environment Variables
// =============================================================================

struct EnvMapping {
    const char* variable;
    const char* key;
    bool is_list;
};

constexpr EnvMapping ENV_MAPPINGS[] = {
    {"PIPEFORGE_ASSEMBLY", config_keys::ASSEMBLY, false},
    {"PIPEFORGE_FAIL_IF_CHANGED", config_keys::FAIL_IF_CHANGED, false},
    {"PIPEFORGE_CONFIG", config_keys::CONFIG_FILE, false},
    {"PIPEFORGE_WORKDIR", config_keys::WORKDIR, false},
    {"PIPEFORGE_REPORT", config_keys::REPORT, false},
    {"PIPEFORGE_LOG_LEVEL", config_keys::LOG_LEVEL, false},
    {"PIPEFORGE_LOG_FILE", config_keys::LOG_FILE, false},
    {"PIPEFORGE_DEPENDENCIES", config_keys::LOADER_DEPENDENCIES, true},
};

std::optional<std::string> system_environment(const std::string& name) {
#ifdef _WIN32
    char* value = nullptr;
    std::size_t size = 0;
    if (_dupenv_s(&value, &size, name.c_str()) == 0 && value != nullptr) {
        std::string result(value);
        free(value);
        return result;
    }
    return std::nullopt;
#else
    const char* value = std::getenv(name.c_str());
    if (value) {
        return std::string(value);
    }
    return std::nullopt;
#endif
}

// =============================================================================
// TOML Flattening
// =============================================================================

Result<void> flatten_table(const toml::table& tbl, const std::string& prefix, ConfigLayer& layer) {
    for (const auto& [name, node] : tbl) {
        std::string key = prefix.empty() ? std::string(name.str()) : prefix + "." + std::string(name.str());

        if (const auto* sub = node.as_table()) {
            auto result = flatten_table(*sub, key, layer);
            if (!result) {
                return result;
            }
        } else if (const auto* b = node.as_boolean()) {
            layer.set(key, ConfigValue{b->get()});
        } else if (const auto* i = node.as_integer()) {
            layer.set(key, ConfigValue{static_cast<std::int64_t>(i->get())});
        } else if (const auto* f = node.as_floating_point()) {
            layer.set(key, ConfigValue{f->get()});
        } else if (const auto* s = node.as_string()) {
            layer.set(key, ConfigValue{s->get()});
        } else if (const auto* arr = node.as_array()) {
            std::vector<std::string> items;
            for (const auto& elem : *arr) {
                auto str = elem.value<std::string>();
                if (!str) {
                    return Error(ConfigError::invalid_value(key, "arrays may only hold strings"));
                }
                items.push_back(*str);
            }
            layer.set(key, ConfigValue{std::move(items)});
        } else {
            return Error(ConfigError::invalid_value(key, "unsupported TOML value type"));
        }
    }
    return Ok();
}

} // anonymous namespace

std::optional<bool> parse_bool(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") return true;
    if (lower == "false" || lower == "0" || lower == "no" || lower == "off") return false;
    return std::nullopt;
}

// =============================================================================
// ConfigLayer
// =============================================================================

bool ConfigLayer::contains(const std::string& key) const {
    return m_values.find(key) != m_values.end();
}

std::optional<ConfigValue> ConfigLayer::get(const std::string& key) const {
    auto it = m_values.find(key);
    if (it != m_values.end()) {
        return it->second;
    }
    return std::nullopt;
}

void ConfigLayer::set(const std::string& key, ConfigValue value) {
    m_values[key] = std::move(value);
}

void ConfigLayer::append(const std::string& key, const std::string& value) {
    auto it = m_values.find(key);
    if (it != m_values.end()) {
        if (auto* list = std::get_if<std::vector<std::string>>(&it->second)) {
            list->push_back(value);
            return;
        }
    }
    m_values[key] = ConfigValue{std::vector<std::string>{value}};
}

bool ConfigLayer::remove(const std::string& key) {
    return m_values.erase(key) > 0;
}

void ConfigLayer::clear() {
    m_values.clear();
}

std::vector<std::string> ConfigLayer::keys() const {
    std::vector<std::string> result;
    result.reserve(m_values.size());
    for (const auto& [key, _] : m_values) {
        result.push_back(key);
    }
    return result;
}

// =============================================================================
// ConfigManager - Layers
// =============================================================================

void ConfigManager::add_layer(std::unique_ptr<ConfigLayer> layer) {
    m_layers.push_back(std::move(layer));
}

ConfigLayer* ConfigManager::get_layer(const std::string& name) {
    for (auto& layer : m_layers) {
        if (layer->name() == name) {
            return layer.get();
        }
    }
    return nullptr;
}

const ConfigLayer* ConfigManager::get_layer(const std::string& name) const {
    for (const auto& layer : m_layers) {
        if (layer->name() == name) {
            return layer.get();
        }
    }
    return nullptr;
}

ConfigLayer& ConfigManager::ensure_layer(const std::string& name, ConfigLayerPriority priority) {
    if (auto* layer = get_layer(name)) {
        return *layer;
    }
    auto layer = std::make_unique<ConfigLayer>(name, priority);
    auto& ref = *layer;
    add_layer(std::move(layer));
    return ref;
}

std::vector<const ConfigLayer*> ConfigManager::sorted_layers() const {
    std::vector<const ConfigLayer*> result;
    result.reserve(m_layers.size());
    for (const auto& layer : m_layers) {
        result.push_back(layer.get());
    }

    // Lower value = higher priority
    std::stable_sort(result.begin(), result.end(),
        [](const ConfigLayer* a, const ConfigLayer* b) {
            return static_cast<int>(a->priority()) < static_cast<int>(b->priority());
        });

    return result;
}

// =============================================================================
// ConfigManager - Values
// =============================================================================

bool ConfigManager::contains(const std::string& key) const {
    return get(key).has_value();
}

std::optional<ConfigValue> ConfigManager::get(const std::string& key) const {
    for (const auto* layer : sorted_layers()) {
        auto value = layer->get(key);
        if (value) {
            return value;
        }
    }
    return std::nullopt;
}

bool ConfigManager::get_bool(const std::string& key, bool default_value) const {
    auto value = get(key);
    if (!value) return default_value;

    if (auto* v = std::get_if<bool>(&*value)) {
        return *v;
    }
    if (auto* v = std::get_if<std::string>(&*value)) {
        return parse_bool(*v).value_or(default_value);
    }
    if (auto* v = std::get_if<std::int64_t>(&*value)) {
        return *v != 0;
    }

    return default_value;
}

std::int64_t ConfigManager::get_int(const std::string& key, std::int64_t default_value) const {
    auto value = get(key);
    if (!value) return default_value;

    if (auto* v = std::get_if<std::int64_t>(&*value)) {
        return *v;
    }
    if (auto* v = std::get_if<double>(&*value)) {
        return static_cast<std::int64_t>(*v);
    }
    if (auto* v = std::get_if<bool>(&*value)) {
        return *v ? 1 : 0;
    }

    return default_value;
}

std::string ConfigManager::get_string(const std::string& key, const std::string& default_value) const {
    auto value = get(key);
    if (!value) return default_value;

    if (auto* v = std::get_if<std::string>(&*value)) {
        return *v;
    }
    if (auto* v = std::get_if<bool>(&*value)) {
        return *v ? "true" : "false";
    }
    if (auto* v = std::get_if<std::int64_t>(&*value)) {
        return std::to_string(*v);
    }
    if (auto* v = std::get_if<double>(&*value)) {
        return std::to_string(*v);
    }

    return default_value;
}

std::vector<std::string> ConfigManager::get_string_array(
    const std::string& key,
    const std::vector<std::string>& default_value) const
{
    auto value = get(key);
    if (!value) return default_value;

    if (auto* v = std::get_if<std::vector<std::string>>(&*value)) {
        return *v;
    }
    if (auto* v = std::get_if<std::string>(&*value)) {
        return split_list(*v);
    }

    return default_value;
}

void ConfigManager::set(const std::string& key, ConfigValue value, const std::string& layer_name) {
    ensure_layer(layer_name, ConfigLayerPriority::File).set(key, std::move(value));
}

// =============================================================================
// ConfigManager - Sources
// =============================================================================

Result<void> ConfigManager::load_toml(const std::filesystem::path& path, const std::string& layer_name) {
    std::ifstream file(path);
    if (!file) {
        return Error(ConfigError::parse_error(path.string(), "file cannot be opened"));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    return load_toml_string(buffer.str(), path.string(), layer_name);
}

Result<void> ConfigManager::load_toml_string(
    const std::string& content,
    const std::string& source_name,
    const std::string& layer_name)
{
    toml::table tbl;
    try {
        tbl = toml::parse(content, source_name);
    } catch (const toml::parse_error& err) {
        return Error(ConfigError::parse_error(source_name, err.what()));
    }

    // Parse into a scratch layer so that a bad file leaves no partial values
    ConfigLayer scratch(layer_name, ConfigLayerPriority::File);
    auto result = flatten_table(tbl, "", scratch);
    if (!result) {
        result.error().with_context("source", source_name);
        return result;
    }

    auto& layer = ensure_layer(layer_name, ConfigLayerPriority::File);
    for (const auto& key : scratch.keys()) {
        if (auto value = scratch.get(key)) {
            layer.set(key, std::move(*value));
        }
    }

    return Ok();
}

Result<void> ConfigManager::parse_args(int argc, char** argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return parse_args(args);
}

Result<void> ConfigManager::parse_args(const std::vector<std::string>& args) {
    auto& layer = ensure_layer("cmdline", ConfigLayerPriority::CommandLine);

    for (std::size_t i = 0; i < args.size(); ++i) {
        const auto& arg = args[i];

        if (arg == "-h") {
            layer.set(config_keys::HELP, ConfigValue{true});
            continue;
        }

        // Positional argument: the module to scan
        if (!arg.starts_with("-")) {
            if (layer.contains(config_keys::ASSEMBLY)) {
                return Error(ConfigError::unknown_option(arg));
            }
            layer.set(config_keys::ASSEMBLY, ConfigValue{arg});
            continue;
        }

        if (!arg.starts_with("--")) {
            return Error(ConfigError::unknown_option(arg));
        }

        // Handle --key=value or --key value
        std::string name = arg.substr(2);
        std::optional<std::string> inline_value;
        auto eq_pos = name.find('=');
        if (eq_pos != std::string::npos) {
            inline_value = name.substr(eq_pos + 1);
            name = name.substr(0, eq_pos);
        }

        if (name == "verbose") {
            layer.set(config_keys::LOG_LEVEL, ConfigValue{std::string("debug")});
            continue;
        }

        const OptionSpec* spec = find_option(name);
        if (!spec) {
            return Error(ConfigError::unknown_option(arg));
        }

        if (spec->kind == OptionKind::Flag) {
            bool flag = true;
            if (inline_value) {
                auto parsed = parse_bool(*inline_value);
                if (!parsed) {
                    return Error(ConfigError::invalid_value(spec->key, *inline_value));
                }
                flag = *parsed;
            }
            layer.set(spec->key, ConfigValue{flag});
            continue;
        }

        std::string value;
        if (inline_value) {
            value = *inline_value;
        } else if (i + 1 < args.size() && !args[i + 1].starts_with("--")) {
            value = args[++i];
        } else {
            return Error(ConfigError::invalid_value(spec->key, "missing value for --" + name));
        }

        if (spec->kind == OptionKind::Append) {
            layer.append(spec->key, value);
        } else {
            layer.set(spec->key, ConfigValue{value});
        }
    }

    return Ok();
}

void ConfigManager::load_environment() {
    load_environment(system_environment);
}

void ConfigManager::load_environment(const EnvironmentLookup& lookup) {
    auto& layer = ensure_layer("environment", ConfigLayerPriority::Environment);

    for (const auto& mapping : ENV_MAPPINGS) {
        auto value = lookup(mapping.variable);
        if (!value) {
            continue;
        }
        if (mapping.is_list) {
            layer.set(mapping.key, ConfigValue{split_list(*value)});
        } else {
            layer.set(mapping.key, ConfigValue{*value});
        }
    }
}

// =============================================================================
// ConfigManager - Defaults
// =============================================================================

void ConfigManager::create_default_layers() {
    ensure_layer("cmdline", ConfigLayerPriority::CommandLine);
    ensure_layer("environment", ConfigLayerPriority::Environment);
    ensure_layer("file", ConfigLayerPriority::File);
    ensure_layer("defaults", ConfigLayerPriority::Default);
}

void ConfigManager::setup_defaults() {
    create_default_layers();

    auto* defaults = get_layer("defaults");
    if (!defaults) return;

    defaults->set(config_keys::FAIL_IF_CHANGED, ConfigValue{false});
    defaults->set(config_keys::LOG_LEVEL, ConfigValue{std::string("info")});
    defaults->set(config_keys::LOADER_DEPENDENCIES, ConfigValue{pipeforge_module::LoaderConfig{}.dependencies});
}

// =============================================================================
// ConfigManager - Conversion
// =============================================================================

Result<PublishSettings> ConfigManager::build_publish_settings() const {
    PublishSettings settings;

    auto assembly = get_string(config_keys::ASSEMBLY);
    if (assembly.empty()) {
        return Error(ConfigError::missing_required(config_keys::ASSEMBLY));
    }
    settings.assembly = assembly;

    if (auto value = get(config_keys::FAIL_IF_CHANGED)) {
        if (auto* b = std::get_if<bool>(&*value)) {
            settings.fail_if_changed = *b;
        } else if (auto* s = std::get_if<std::string>(&*value)) {
            auto parsed = parse_bool(*s);
            if (!parsed) {
                return Error(ConfigError::invalid_value(config_keys::FAIL_IF_CHANGED, *s));
            }
            settings.fail_if_changed = *parsed;
        } else if (auto* i = std::get_if<std::int64_t>(&*value)) {
            settings.fail_if_changed = *i != 0;
        } else {
            return Error(ConfigError::invalid_value(config_keys::FAIL_IF_CHANGED, "expected a boolean"));
        }
    }

    auto level_name = get_string(config_keys::LOG_LEVEL, "info");
    auto level = pipeforge_core::parse_log_level(level_name);
    if (!level) {
        return Error(ConfigError::invalid_value(config_keys::LOG_LEVEL, level_name));
    }
    settings.logging.level = *level;

    auto log_file = get_string(config_keys::LOG_FILE);
    if (!log_file.empty()) {
        settings.logging.file_enabled = true;
        settings.logging.log_file = log_file;
    }

    settings.loader.dependencies = get_string_array(
        config_keys::LOADER_DEPENDENCIES, pipeforge_module::LoaderConfig{}.dependencies);

    settings.workdir = get_string(config_keys::WORKDIR);
    settings.report = get_string(config_keys::REPORT);

    return settings;
}

} // namespace pipeforge_app
