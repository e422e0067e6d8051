/// @file error.cpp
/// @brief Error handling implementation for pipeforge_core
///
/// The error system is primarily template-based and header-only.
/// This file provides:
/// - Explicit template instantiations for common Result types
/// - Error formatting utilities used for verbose diagnostics

#include <pipeforge/core/error.hpp>

#include <sstream>
#include <vector>

namespace pipeforge_core {

// =============================================================================
// Error Message Formatting
// =============================================================================

namespace detail {

std::string format_load_error(const LoadError& err) {
    std::ostringstream oss;
    oss << "[LoadError] " << err.message;

    if (!err.artifact.empty()) {
        oss << " (artifact: " << err.artifact << ")";
    }
    if (!err.dependency.empty()) {
        oss << " (dependency: " << err.dependency << ")";
    }

    return oss.str();
}

std::string format_discovery_error(const DiscoveryError& err) {
    std::ostringstream oss;
    oss << "[DiscoveryError] " << err.message;

    if (!err.type_name.empty()) {
        oss << " (type: " << err.type_name << ")";
    }

    return oss.str();
}

std::string format_definition_error(const DefinitionError& err) {
    std::ostringstream oss;
    oss << "[DefinitionError] " << err.message;

    if (!err.definition.empty()) {
        oss << " (definition: " << err.definition << ")";
    }

    return oss.str();
}

std::string format_config_error(const ConfigError& err) {
    std::ostringstream oss;
    oss << "[ConfigError] " << err.message;

    if (!err.key.empty()) {
        oss << " (key: " << err.key << ")";
    }

    return oss.str();
}

} // namespace detail

// =============================================================================
// Error Chain Support
// =============================================================================

std::string build_error_chain(const Error& error) {
    std::ostringstream oss;

    oss << "[" << error_code_name(error.code()) << "] ";

    std::visit([&oss](const auto& err) {
        using T = std::decay_t<decltype(err)>;
        if constexpr (std::is_same_v<T, std::string>) {
            oss << err;
        } else if constexpr (std::is_same_v<T, LoadError>) {
            oss << detail::format_load_error(err);
        } else if constexpr (std::is_same_v<T, DiscoveryError>) {
            oss << detail::format_discovery_error(err);
        } else if constexpr (std::is_same_v<T, DefinitionError>) {
            oss << detail::format_definition_error(err);
        } else if constexpr (std::is_same_v<T, ConfigError>) {
            oss << detail::format_config_error(err);
        }
    }, error.variant());

    for (const auto& [key, value] : error.context()) {
        oss << "\n  " << key << ": " << value;
    }

    return oss.str();
}

// =============================================================================
// Explicit Template Instantiations
// =============================================================================

template class Result<void, Error>;
template class Result<bool, Error>;
template class Result<std::string, Error>;
template class Result<std::vector<std::string>, Error>;

} // namespace pipeforge_core
