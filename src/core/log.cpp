/// @file log.cpp
/// @brief Logging system implementation for tether_core
///
/// Extends the spdlog-based logging with:
/// - Multiple named loggers for the binding layers
/// - Log level configuration

#include <tether/core/log.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <mutex>
#include <map>
#include <memory>
#include <vector>

namespace tether_core {

// =============================================================================
// Logger Registry
// =============================================================================

namespace {

/// Registry of named loggers
struct LoggerRegistry {
    std::mutex mutex;
    std::map<std::string, std::shared_ptr<spdlog::logger>> loggers;
    spdlog::level::level_enum global_level = spdlog::level::info;
    std::string file_path;
    bool console_enabled = true;
    bool file_enabled = false;
    std::size_t max_file_size = 10 * 1024 * 1024;  // 10 MB
    std::size_t max_files = 5;
    spdlog::sink_ptr console_sink;
    spdlog::sink_ptr file_sink;
};

LoggerRegistry& get_registry() {
    static LoggerRegistry registry;
    return registry;
}

/// Create sinks based on current configuration
/// Sinks are shared by every named logger so a single log file holds all of them.
std::vector<spdlog::sink_ptr> create_sinks(LoggerRegistry& reg) {
    std::vector<spdlog::sink_ptr> sinks;

    // Console sink
    if (reg.console_enabled) {
        if (!reg.console_sink) {
            reg.console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            reg.console_sink->set_pattern("[%H:%M:%S.%e] [%^%l%$] [%n] %v");
        }
        sinks.push_back(reg.console_sink);
    }

    // File sink
    if (reg.file_enabled && !reg.file_path.empty()) {
        if (!reg.file_sink) {
            try {
                reg.file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    reg.file_path,
                    reg.max_file_size,
                    reg.max_files);
                reg.file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");
            } catch (const spdlog::spdlog_ex& ex) {
                // Continue with console only
                spdlog::warn("Cannot open log file '{}': {}", reg.file_path, ex.what());
            }
        }
        if (reg.file_sink) {
            sinks.push_back(reg.file_sink);
        }
    }

    return sinks;
}

} // anonymous namespace

// =============================================================================
// Logger Configuration
// =============================================================================

/// Configure logging system
void configure_logging(const LogConfig& config) {
    auto& reg = get_registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    if (reg.file_path != config.file_path || reg.max_file_size != config.max_file_size ||
        reg.max_files != config.max_files) {
        reg.file_sink.reset();
    }

    reg.console_enabled = config.console_enabled;
    reg.file_enabled = config.file_enabled;
    reg.file_path = config.file_path;
    reg.max_file_size = config.max_file_size;
    reg.max_files = config.max_files;
    reg.global_level = config.level;

    // Rebuild the sink set of existing loggers
    auto sinks = create_sinks(reg);
    for (auto& [name, logger] : reg.loggers) {
        logger->sinks() = sinks;
        logger->set_level(reg.global_level);
    }

    // Update default spdlog level
    spdlog::set_level(reg.global_level);
}

/// Get or create a named logger
std::shared_ptr<spdlog::logger> get_logger(const std::string& name) {
    auto& reg = get_registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    // Check if logger already exists
    auto it = reg.loggers.find(name);
    if (it != reg.loggers.end()) {
        return it->second;
    }

    // Create new logger
    auto sinks = create_sinks(reg);
    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(reg.global_level);

    reg.loggers[name] = logger;
    if (!spdlog::get(name)) {
        spdlog::register_logger(logger);
    }

    return logger;
}

/// Get the core module logger
std::shared_ptr<spdlog::logger> core_logger() {
    return get_logger("tether_core");
}

/// Get the native boundary logger
std::shared_ptr<spdlog::logger> native_logger() {
    return get_logger("tether_native");
}

/// Get the element logger
std::shared_ptr<spdlog::logger> element_logger() {
    return get_logger("tether_element");
}

/// Get the callback registry logger
std::shared_ptr<spdlog::logger> callback_logger() {
    return get_logger("tether_callback");
}

// =============================================================================
// Log Level Management
// =============================================================================

/// Set global log level
void set_global_log_level(spdlog::level::level_enum level) {
    auto& reg = get_registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    reg.global_level = level;
    spdlog::set_level(level);

    for (auto& [name, logger] : reg.loggers) {
        logger->set_level(level);
    }
}

/// Set log level for specific logger
void set_logger_level(const std::string& name, spdlog::level::level_enum level) {
    auto& reg = get_registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    auto it = reg.loggers.find(name);
    if (it != reg.loggers.end()) {
        it->second->set_level(level);
    }
}

/// Get current global log level
spdlog::level::level_enum get_global_log_level() {
    auto& reg = get_registry();
    std::lock_guard<std::mutex> lock(reg.mutex);
    return reg.global_level;
}

/// Parse log level from string
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

/// Get log level name
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
// Logging Shutdown
// =============================================================================

/// Flush all loggers
void flush_all_loggers() {
    auto& reg = get_registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    for (auto& [name, logger] : reg.loggers) {
        logger->flush();
    }
    spdlog::default_logger()->flush();
}

/// Shutdown logging system
void shutdown_logging() {
    flush_all_loggers();

    auto& reg = get_registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    // Drop all loggers
    for (auto& [name, logger] : reg.loggers) {
        spdlog::drop(name);
    }
    reg.loggers.clear();
    reg.console_sink.reset();
    reg.file_sink.reset();
}

} // namespace tether_core
