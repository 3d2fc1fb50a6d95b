#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for tether_core module

#include <cstdint>

namespace tether_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
struct NativeError;
struct HandleError;
struct ConfigError;
class Error;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Logging
// =============================================================================

struct LogConfig;

// =============================================================================
// Configuration
// =============================================================================

struct Config;

} // namespace tether_core
