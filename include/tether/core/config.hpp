#pragma once

/// @file config.hpp
/// @brief Binding configuration for tether
///
/// Configuration is a plain struct with defaults. It can be read from a
/// JSON document:
///
/// @code
/// {
///   "log": { "level": "info", "console": true, "file": "logs/tether.log" },
///   "registry": { "enforce_thread_affinity": true },
///   "trace": { "lifecycle": false, "downcasts": false }
/// }
/// @endcode
///
/// Missing keys keep their defaults.

#include "fwd.hpp"
#include "error.hpp"
#include "log.hpp"
#include <string>

namespace tether_core {

// =============================================================================
// Config
// =============================================================================

/// Runtime configuration of the binding layer
struct Config {
    /// Logging setup
    LogConfig log;

    /// Reject callback registry access from a thread other than its owner
    bool enforce_thread_affinity = true;

    /// Trace hook installation, hook firing and callback (un)registration
    bool trace_lifecycle = false;

    /// Trace every downcast attempt, not only mismatches
    bool trace_downcasts = false;
};

/// Parse configuration from JSON text
[[nodiscard]] Result<Config> parse_config(const std::string& json_text);

/// Load configuration from a JSON file
[[nodiscard]] Result<Config> load_config(const std::string& path);

/// Serialize configuration to pretty-printed JSON
[[nodiscard]] std::string config_to_json(const Config& config);

} // namespace tether_core
