#pragma once

/// @file error.hpp
/// @brief Error handling types for pipeforge_core

#include "fwd.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace pipeforge_core {

// =============================================================================
// ErrorCode
// =============================================================================

/// General error code for categorizing errors
enum class ErrorCode : std::uint8_t {
    Unknown = 0,
    NotFound,
    InvalidArgument,
    InvalidState,
    IOError,
    ParseError,
    ValidationError,
    IncompatibleVersion,
    DependencyMissing,
    CorruptData,
};

/// Get error code name
[[nodiscard]] inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::IOError: return "IOError";
        case ErrorCode::ParseError: return "ParseError";
        case ErrorCode::ValidationError: return "ValidationError";
        case ErrorCode::IncompatibleVersion: return "IncompatibleVersion";
        case ErrorCode::DependencyMissing: return "DependencyMissing";
        case ErrorCode::CorruptData: return "CorruptData";
        default: return "Unknown";
    }
}

// =============================================================================
// Error Kinds
// =============================================================================

/// Module loading errors (fatal for a run)
struct LoadError {
    enum class Kind : std::uint8_t {
        MissingArtifact,    // Primary module file does not exist
        MissingDependency,  // Auxiliary library not found beside the module
        CorruptArtifact,    // File exists but cannot be loaded
        MissingEntryPoint,  // Module does not export its catalog
        ApiMismatch,        // Catalog API version not understood
        InvalidState,       // Loader used more than once
    };

    Kind kind;
    std::string message;
    std::string artifact;
    std::string dependency;  // For MissingDependency

    [[nodiscard]] static LoadError missing_artifact(const std::string& path) {
        return LoadError{Kind::MissingArtifact, "Module not found: " + path, path, {}};
    }

    [[nodiscard]] static LoadError missing_dependency(const std::string& dep, const std::string& searched) {
        return LoadError{Kind::MissingDependency,
            "Failed to find dependency '" + dep + "' at " + searched +
            ". Make sure the module's output directory contains this library.",
            searched, dep};
    }

    [[nodiscard]] static LoadError corrupt_artifact(const std::string& path, const std::string& reason) {
        return LoadError{Kind::CorruptArtifact, "Failed to load '" + path + "': " + reason, path, {}};
    }

    [[nodiscard]] static LoadError missing_entry_point(const std::string& path, const std::string& symbol) {
        return LoadError{Kind::MissingEntryPoint,
            "Module '" + path + "' does not export " + symbol, path, {}};
    }

    [[nodiscard]] static LoadError api_mismatch(const std::string& path, std::uint32_t expected, std::uint32_t found) {
        return LoadError{Kind::ApiMismatch,
            "Module '" + path + "' API version mismatch: expected " + std::to_string(expected) +
            ", found " + std::to_string(found), path, {}};
    }

    [[nodiscard]] static LoadError invalid_state(const std::string& reason) {
        return LoadError{Kind::InvalidState, "Module loader invalid state: " + reason, {}, {}};
    }
};

/// Definition discovery errors (fatal for a run)
struct DiscoveryError {
    enum class Kind : std::uint8_t {
        NoDefinitions,        // Catalog contained no definition types
        InstantiationFailed,  // Default construction of a definition failed
    };

    Kind kind;
    std::string message;
    std::string type_name;

    [[nodiscard]] static DiscoveryError no_definitions(const std::string& module, const std::string& contract) {
        return DiscoveryError{Kind::NoDefinitions,
            "No definitions deriving from " + contract + " found in " + module, {}};
    }

    [[nodiscard]] static DiscoveryError instantiation_failed(const std::string& type, const std::string& reason) {
        return DiscoveryError{Kind::InstantiationFailed,
            "Failed to instantiate " + type + ": " + reason, type};
    }
};

/// Per-definition errors (recoverable, reported against one definition)
struct DefinitionError {
    enum class Kind : std::uint8_t {
        InvalidTargetPath,
        ValidationFailed,
        PublishFailed,
    };

    Kind kind;
    std::string message;
    std::string definition;

    [[nodiscard]] static DefinitionError invalid_target_path(const std::string& def, const std::string& reason) {
        return DefinitionError{Kind::InvalidTargetPath, "Failed to get target path for " + def + ": " + reason, def};
    }

    [[nodiscard]] static DefinitionError validation_failed(const std::string& def, const std::string& reason) {
        return DefinitionError{Kind::ValidationFailed, reason, def};
    }

    [[nodiscard]] static DefinitionError publish_failed(const std::string& def, const std::string& reason) {
        return DefinitionError{Kind::PublishFailed, "Failed to publish " + def + ": " + reason, def};
    }
};

/// Configuration errors
struct ConfigError {
    enum class Kind : std::uint8_t {
        MissingRequired,
        InvalidValue,
        ParseError,
        UnknownOption,
    };

    Kind kind;
    std::string message;
    std::string key;

    [[nodiscard]] static ConfigError missing_required(const std::string& key) {
        return ConfigError{Kind::MissingRequired, "Required parameter not set: " + key, key};
    }

    [[nodiscard]] static ConfigError invalid_value(const std::string& key, const std::string& value) {
        return ConfigError{Kind::InvalidValue, "Invalid value for " + key + ": " + value, key};
    }

    [[nodiscard]] static ConfigError parse_error(const std::string& source, const std::string& reason) {
        return ConfigError{Kind::ParseError, "Failed to parse " + source + ": " + reason, {}};
    }

    [[nodiscard]] static ConfigError unknown_option(const std::string& option) {
        return ConfigError{Kind::UnknownOption, "Unknown argument: " + option, option};
    }
};

// =============================================================================
// Error
// =============================================================================

/// Main error type (variant of all error kinds)
class Error {
public:
    using Variant = std::variant<
        LoadError,
        DiscoveryError,
        DefinitionError,
        ConfigError,
        std::string  // Generic message
    >;

    /// Constructors
    Error() : m_code(ErrorCode::Unknown), m_error("Unknown error") {}
    Error(LoadError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(DiscoveryError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(DefinitionError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(ConfigError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(const std::string& msg) : m_code(ErrorCode::Unknown), m_error(msg) {}
    Error(const char* msg) : m_code(ErrorCode::Unknown), m_error(std::string(msg)) {}

    /// Construct with error code and message
    Error(ErrorCode code, const std::string& msg) : m_code(code), m_error(msg) {}

    /// Get error code
    [[nodiscard]] ErrorCode code() const noexcept { return m_code; }

    /// Get error message
    [[nodiscard]] std::string message() const {
        return std::visit([](const auto& err) -> std::string {
            using T = std::decay_t<decltype(err)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return err;
            } else {
                return err.message;
            }
        }, m_error);
    }

    /// Check error type
    template<typename T>
    [[nodiscard]] bool is() const {
        return std::holds_alternative<T>(m_error);
    }

    /// Get error as specific type
    template<typename T>
    [[nodiscard]] const T* as() const {
        return std::get_if<T>(&m_error);
    }

    [[nodiscard]] const Variant& variant() const noexcept { return m_error; }

    /// Add context information
    Error& with_context(const std::string& key, const std::string& value) {
        m_context[key] = value;
        return *this;
    }

    /// Get context value
    [[nodiscard]] const std::string* get_context(const std::string& key) const {
        auto it = m_context.find(key);
        return it != m_context.end() ? &it->second : nullptr;
    }

    [[nodiscard]] const std::map<std::string, std::string>& context() const noexcept { return m_context; }

private:
    static ErrorCode to_error_code(LoadError::Kind kind) {
        switch (kind) {
            case LoadError::Kind::MissingArtifact: return ErrorCode::NotFound;
            case LoadError::Kind::MissingDependency: return ErrorCode::DependencyMissing;
            case LoadError::Kind::CorruptArtifact: return ErrorCode::CorruptData;
            case LoadError::Kind::MissingEntryPoint: return ErrorCode::NotFound;
            case LoadError::Kind::ApiMismatch: return ErrorCode::IncompatibleVersion;
            case LoadError::Kind::InvalidState: return ErrorCode::InvalidState;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(DiscoveryError::Kind kind) {
        switch (kind) {
            case DiscoveryError::Kind::NoDefinitions: return ErrorCode::NotFound;
            case DiscoveryError::Kind::InstantiationFailed: return ErrorCode::InvalidState;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(DefinitionError::Kind kind) {
        switch (kind) {
            case DefinitionError::Kind::InvalidTargetPath: return ErrorCode::InvalidArgument;
            case DefinitionError::Kind::ValidationFailed: return ErrorCode::ValidationError;
            case DefinitionError::Kind::PublishFailed: return ErrorCode::IOError;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(ConfigError::Kind kind) {
        switch (kind) {
            case ConfigError::Kind::MissingRequired: return ErrorCode::InvalidArgument;
            case ConfigError::Kind::InvalidValue: return ErrorCode::InvalidArgument;
            case ConfigError::Kind::ParseError: return ErrorCode::ParseError;
            case ConfigError::Kind::UnknownOption: return ErrorCode::InvalidArgument;
            default: return ErrorCode::Unknown;
        }
    }

    ErrorCode m_code;
    Variant m_error;
    std::map<std::string, std::string> m_context;
};

// =============================================================================
// Result<T, E>
// =============================================================================

/// Result type carrying either a value or an error
/// @tparam T Value type
/// @tparam E Error type (defaults to Error)
template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    /// Success constructor
    Result(T value) : m_value(std::move(value)) {}

    /// Error constructor
    Result(E error) : m_error(std::move(error)) {}

    [[nodiscard]] bool is_ok() const noexcept { return m_value.has_value(); }
    [[nodiscard]] bool is_err() const noexcept { return !m_value.has_value(); }

    /// Get value (undefined if error)
    [[nodiscard]] T& value() & { return *m_value; }
    [[nodiscard]] const T& value() const& { return *m_value; }
    [[nodiscard]] T&& value() && { return std::move(*m_value); }

    /// Get error (undefined if ok)
    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    /// Get value or default
    [[nodiscard]] T value_or(T default_value) const {
        return m_value.has_value() ? *m_value : std::move(default_value);
    }

    explicit operator bool() const noexcept { return m_value.has_value(); }

    [[nodiscard]] T& operator*() & { return *m_value; }
    [[nodiscard]] const T& operator*() const& { return *m_value; }
    [[nodiscard]] T&& operator*() && { return std::move(*m_value); }

    [[nodiscard]] T* operator->() { return &(*m_value); }
    [[nodiscard]] const T* operator->() const { return &(*m_value); }

    /// Map success value
    template<typename F>
    auto map(F&& func) -> Result<decltype(func(std::declval<T>())), E> {
        using U = decltype(func(std::declval<T>()));
        if (m_value.has_value()) {
            return Result<U, E>(func(std::move(*m_value)));
        }
        return Result<U, E>(std::move(m_error));
    }

    /// Chain operations
    template<typename F>
    auto and_then(F&& func) -> decltype(func(std::declval<T>())) {
        if (m_value.has_value()) {
            return func(std::move(*m_value));
        }
        using ResultType = decltype(func(std::declval<T>()));
        return ResultType(std::move(m_error));
    }

private:
    std::optional<T> m_value;
    E m_error;
};

/// Partial specialization for void result
template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    /// Success constructor
    Result() : m_has_value(true) {}

    /// Error constructor
    Result(E error) : m_error(std::move(error)), m_has_value(false) {}

    [[nodiscard]] static Result ok() { return Result(); }

    [[nodiscard]] bool is_ok() const noexcept { return m_has_value; }
    [[nodiscard]] bool is_err() const noexcept { return !m_has_value; }

    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    explicit operator bool() const noexcept { return m_has_value; }

private:
    E m_error;
    bool m_has_value;
};

/// Helper for creating Ok result
template<typename T>
Result<T> Ok(T value) {
    return Result<T>(std::move(value));
}

/// Helper for creating Ok void result
inline Result<void> Ok() {
    return Result<void>();
}

/// Helper for creating Err result
template<typename T = void>
Result<T> Err(Error error) {
    return Result<T>(std::move(error));
}

template<typename T = void>
Result<T> Err(const std::string& message) {
    return Result<T>(Error(message));
}

// =============================================================================
// Error Utilities (Implemented in error.cpp)
// =============================================================================

/// Build a full error message with kind details and context
std::string build_error_chain(const Error& error);

} // namespace pipeforge_core
