#ifndef UCOP_COMMON_CONFIG_ENGINE_CONFIG_H
#define UCOP_COMMON_CONFIG_ENGINE_CONFIG_H

#include "common/utils/logging.h"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace ucop {

struct EngineConfig {
    size_t max_concurrency = 4;
    std::string checkpoint_dir = ".checkpoints";
    size_t checkpoint_keep_last = 10;                      // 0 = never prune
    int checkpoint_save_attempts = 3;
    std::chrono::milliseconds checkpoint_retry_backoff{50}; // doubled after every failed attempt
    std::chrono::milliseconds step_retry_backoff{0};
    std::optional<std::chrono::milliseconds> default_step_timeout;
    size_t event_history_limit = 1000;                     // 0 = no history
    LogLevel log_level = LogLevel::INFO;
};

// Reads a YAML or JSON config file. A missing file yields defaults, invalid
// values throw ConfigError. Environment overrides are applied last.
EngineConfig load_engine_config(const std::string& config_path = "ucop_config.yaml");

// Overlays the keys present in j onto defaults. Throws ConfigError.
EngineConfig engine_config_from_json(const nlohmann::json& j);

// UCOP_CHECKPOINT_DIR, UCOP_MAX_CONCURRENCY, UCOP_LOG_LEVEL
void apply_env_overrides(EngineConfig& config);

} // namespace ucop

#endif // UCOP_COMMON_CONFIG_ENGINE_CONFIG_H
