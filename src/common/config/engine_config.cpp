// common/config/engine_config.cpp
#include "common/config/engine_config.h"
#include "common/utils/yaml_json.h"
#include "core/types/errors.h"
#include <yaml-cpp/yaml.h>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace ucop {

namespace {

int64_t require_integer(const nlohmann::json& j, const char* key, int64_t min_value) {
    const auto& v = j.at(key);
    if (!v.is_number_integer()) {
        throw ConfigError(std::string("Config key '") + key + "' must be an integer, got " + v.dump());
    }
    int64_t value = v.get<int64_t>();
    if (value < min_value) {
        throw ConfigError(std::string("Config key '") + key + "' must be >= " + std::to_string(min_value) +
                          ", got " + std::to_string(value));
    }
    return value;
}

size_t parse_concurrency(const std::string& text) {
    try {
        size_t pos = 0;
        long long value = std::stoll(text, &pos);
        if (pos != text.size() || value < 1) {
            throw ConfigError("UCOP_MAX_CONCURRENCY must be a positive integer, got '" + text + "'");
        }
        return static_cast<size_t>(value);
    } catch (const std::logic_error&) {
        throw ConfigError("UCOP_MAX_CONCURRENCY must be a positive integer, got '" + text + "'");
    }
}

} // namespace

EngineConfig engine_config_from_json(const nlohmann::json& j) {
    EngineConfig config;
    if (j.is_null()) {
        return config;
    }
    if (!j.is_object()) {
        throw ConfigError("Engine config must be a mapping");
    }

    if (j.contains("max_concurrency")) {
        config.max_concurrency = static_cast<size_t>(require_integer(j, "max_concurrency", 1));
    }
    if (j.contains("checkpoint_dir")) {
        if (!j["checkpoint_dir"].is_string() || j["checkpoint_dir"].get<std::string>().empty()) {
            throw ConfigError("Config key 'checkpoint_dir' must be a non-empty string");
        }
        config.checkpoint_dir = j["checkpoint_dir"].get<std::string>();
    }
    if (j.contains("checkpoint_keep_last")) {
        config.checkpoint_keep_last = static_cast<size_t>(require_integer(j, "checkpoint_keep_last", 0));
    }
    if (j.contains("checkpoint_save_attempts")) {
        config.checkpoint_save_attempts = static_cast<int>(require_integer(j, "checkpoint_save_attempts", 1));
    }
    if (j.contains("checkpoint_retry_backoff_ms")) {
        config.checkpoint_retry_backoff = std::chrono::milliseconds(require_integer(j, "checkpoint_retry_backoff_ms", 0));
    }
    if (j.contains("step_retry_backoff_ms")) {
        config.step_retry_backoff = std::chrono::milliseconds(require_integer(j, "step_retry_backoff_ms", 0));
    }
    if (j.contains("default_step_timeout_ms")) {
        int64_t ms = require_integer(j, "default_step_timeout_ms", 0);
        if (ms > 0) {
            config.default_step_timeout = std::chrono::milliseconds(ms);
        }
    }
    if (j.contains("event_history_limit")) {
        config.event_history_limit = static_cast<size_t>(require_integer(j, "event_history_limit", 0));
    }
    if (j.contains("log_level")) {
        const auto& v = j["log_level"];
        std::optional<LogLevel> level;
        if (v.is_string()) {
            level = parse_log_level(v.get<std::string>());
        }
        if (!level) {
            throw ConfigError("Config key 'log_level' must be one of debug, info, warning, error; got " + v.dump());
        }
        config.log_level = *level;
    }
    return config;
}

void apply_env_overrides(EngineConfig& config) {
    if (const char* dir = std::getenv("UCOP_CHECKPOINT_DIR"); dir && *dir) {
        config.checkpoint_dir = dir;
    }
    if (const char* concurrency = std::getenv("UCOP_MAX_CONCURRENCY"); concurrency && *concurrency) {
        config.max_concurrency = parse_concurrency(concurrency);
    }
    if (const char* level = std::getenv("UCOP_LOG_LEVEL"); level && *level) {
        auto parsed = parse_log_level(level);
        if (!parsed) {
            throw ConfigError(std::string("UCOP_LOG_LEVEL has unknown level '") + level + "'");
        }
        config.log_level = *parsed;
    }
}

EngineConfig load_engine_config(const std::string& config_path) {
    EngineConfig config;

    std::ifstream file(config_path);
    if (!file.is_open()) {
        log_debug("config", "No config file at '" + config_path + "', using defaults");
        apply_env_overrides(config);
        return config;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    nlohmann::json j;
    try {
        j = parse_yaml_document(buffer.str());
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot parse config file '" + config_path + "': " + e.what());
    }

    config = engine_config_from_json(j);
    apply_env_overrides(config);
    return config;
}

} // namespace ucop
