/// @file config.cpp
/// @brief JSON configuration loading for tether_core

#include <tether/core/config.hpp>

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

namespace tether_core {

namespace {

Result<void> read_log_section(const nlohmann::json& j, LogConfig& log) {
    if (!j.is_object()) {
        return Err(ConfigError::invalid_value("log", j.dump()));
    }

    if (j.contains("level")) {
        const auto& level_value = j["level"];
        if (!level_value.is_string()) {
            return Err(ConfigError::invalid_value("log.level", level_value.dump()));
        }
        auto level = parse_log_level(level_value.get<std::string>());
        if (!level) {
            return Err(ConfigError::invalid_value("log.level", level_value.get<std::string>()));
        }
        log.level = *level;
    }

    log.console_enabled = j.value("console", log.console_enabled);

    if (j.contains("file")) {
        log.file_path = j["file"].get<std::string>();
        log.file_enabled = !log.file_path.empty();
    }

    log.max_file_size = j.value("max_file_size", log.max_file_size);
    log.max_files = j.value("max_files", log.max_files);
    return Ok();
}

} // anonymous namespace

// =============================================================================
// Parsing
// =============================================================================

Result<Config> parse_config(const std::string& json_text) {
    Config config;

    try {
        nlohmann::json j = nlohmann::json::parse(json_text);
        if (!j.is_object()) {
            return Err<Config>(ConfigError::parse_error("top-level value must be an object"));
        }

        if (j.contains("log")) {
            auto result = read_log_section(j["log"], config.log);
            if (!result) {
                return Err<Config>(result.error());
            }
        }

        if (j.contains("registry") && j["registry"].is_object()) {
            const auto& registry = j["registry"];
            config.enforce_thread_affinity =
                registry.value("enforce_thread_affinity", config.enforce_thread_affinity);
        }

        if (j.contains("trace") && j["trace"].is_object()) {
            const auto& trace = j["trace"];
            config.trace_lifecycle = trace.value("lifecycle", config.trace_lifecycle);
            config.trace_downcasts = trace.value("downcasts", config.trace_downcasts);
        }
    } catch (const nlohmann::json::parse_error& ex) {
        return Err<Config>(ConfigError::parse_error(ex.what()));
    } catch (const nlohmann::json::type_error& ex) {
        return Err<Config>(ConfigError::parse_error(ex.what()));
    }

    return Ok(std::move(config));
}

Result<Config> load_config(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Err<Config>(ConfigError::io_error(path));
    }

    std::ostringstream contents;
    contents << file.rdbuf();

    auto result = parse_config(contents.str());
    if (!result) {
        Error err = result.error();
        err.with_context("path", path);
        return Err<Config>(std::move(err));
    }
    return result;
}

// =============================================================================
// Serialization
// =============================================================================

std::string config_to_json(const Config& config) {
    nlohmann::json j;

    nlohmann::json log;
    log["level"] = log_level_name(config.log.level);
    log["console"] = config.log.console_enabled;
    log["file"] = config.log.file_enabled ? config.log.file_path : std::string();
    log["max_file_size"] = config.log.max_file_size;
    log["max_files"] = config.log.max_files;
    j["log"] = std::move(log);

    nlohmann::json registry;
    registry["enforce_thread_affinity"] = config.enforce_thread_affinity;
    j["registry"] = std::move(registry);

    nlohmann::json trace;
    trace["lifecycle"] = config.trace_lifecycle;
    trace["downcasts"] = config.trace_downcasts;
    j["trace"] = std::move(trace);

    return j.dump(2);
}

} // namespace tether_core
