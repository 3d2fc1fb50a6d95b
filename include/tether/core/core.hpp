#pragma once

/// @file core.hpp
/// @brief Main include file for tether_core module
///
/// This header includes all tether_core components in dependency order.

// Forward declarations
#include "fwd.hpp"

// Core types
#include "error.hpp"
#include "log.hpp"
#include "config.hpp"

/// @namespace tether_core
/// @brief Infrastructure shared by the binding layers
///
/// - **Error Handling**: Result<T, E> with NativeError / HandleError / ConfigError
/// - **Logging**: named spdlog loggers per layer
/// - **Configuration**: JSON-backed Config applied by init()
///
/// Example usage:
/// @code
/// #include <tether/core/core.hpp>
///
/// auto config = tether_core::load_config("tether.json");
/// tether_core::init(config ? config.value() : tether_core::Config{});
/// // ...
/// tether_core::shutdown();
/// @endcode

namespace tether_core {

/// Module version string
[[nodiscard]] const char* version() noexcept;

/// Module name
[[nodiscard]] const char* module_name() noexcept;

/// Apply a configuration: logging setup and binding behaviour flags
void init(const Config& config);

/// Apply the default configuration
void init();

/// Flush and drop every logger
void shutdown();

/// Configuration applied by the last init() (defaults before that)
[[nodiscard]] const Config& current_config() noexcept;

} // namespace tether_core
