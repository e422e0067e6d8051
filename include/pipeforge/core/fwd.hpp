#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for pipeforge_core

#include <cstdint>

namespace pipeforge_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
struct LoadError;
struct DiscoveryError;
struct DefinitionError;
struct ConfigError;
class Error;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Logging
// =============================================================================

struct LogConfig;
class LogScope;

} // namespace pipeforge_core
