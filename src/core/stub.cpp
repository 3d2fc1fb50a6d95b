/// @file stub.cpp
/// @brief tether_core module initialization and version information

#include <tether/core/core.hpp>

namespace tether_core {

/// Module version
static constexpr const char* k_version = "0.3.0";

/// Module name
static constexpr const char* k_module_name = "tether_core";

namespace {

Config& config_storage() {
    static Config config;
    return config;
}

} // anonymous namespace

/// Get module version string
const char* version() noexcept {
    return k_version;
}

/// Get module name
const char* module_name() noexcept {
    return k_module_name;
}

/// Initialize the binding
/// Must be called from the thread that drives the native toolkit.
void init(const Config& config) {
    config_storage() = config;
    configure_logging(config.log);

    core_logger()->info("{} {} initialized (level={}, thread_affinity={})",
        k_module_name, k_version, log_level_name(config.log.level),
        config.enforce_thread_affinity ? "enforced" : "off");
}

void init() {
    init(Config{});
}

/// Shutdown the binding
void shutdown() {
    core_logger()->info("{} shutting down", k_module_name);
    shutdown_logging();
}

const Config& current_config() noexcept {
    return config_storage();
}

} // namespace tether_core
