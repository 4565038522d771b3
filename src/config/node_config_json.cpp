#include "uidkit/config/node_config_json.h"

#include <nlohmann/json.hpp>

#include <cstdint>

namespace uidkit::config {

using ConfigResult = core::Result<snowflake::NodeConfig, core::ConfigError>;

std::string to_json(const snowflake::NodeConfig& config) {
  using json = nlohmann::json;

  // nlohmann::json default container is std::map, so keys sort alphabetically.
  json j;
  j["epoch_ms"] = config.epoch_ms;
  if (config.max_rollback_wait.has_value()) {
    j["max_rollback_wait_ms"] = config.max_rollback_wait->count();
  }
  j["worker_id"] = config.worker_id;

  return j.dump();
}

ConfigResult node_config_from_json(const std::string& json_str) {
  using json = nlohmann::json;

  const json j = json::parse(json_str, nullptr, /*allow_exceptions=*/false);
  if (j.is_discarded() || !j.is_object()) {
    return ConfigResult::err(core::ConfigError::kInvalidDocument);
  }

  const auto is_integer = [&j](const char* key) {
    return j.contains(key) && j.at(key).is_number_integer();
  };

  if (!is_integer("worker_id")) {
    return ConfigResult::err(core::ConfigError::kInvalidDocument);
  }

  snowflake::NodeConfig config;
  config.worker_id = j.at("worker_id").get<std::int64_t>();
  if (config.worker_id < 0 || config.worker_id > snowflake::kMaxWorkerId) {
    return ConfigResult::err(core::ConfigError::kWorkerIdOutOfRange);
  }

  if (j.contains("epoch_ms")) {
    if (!is_integer("epoch_ms")) {
      return ConfigResult::err(core::ConfigError::kInvalidDocument);
    }
    config.epoch_ms = j.at("epoch_ms").get<std::int64_t>();
  }

  if (j.contains("max_rollback_wait_ms")) {
    if (!is_integer("max_rollback_wait_ms")) {
      return ConfigResult::err(core::ConfigError::kInvalidDocument);
    }
    const auto wait_ms = j.at("max_rollback_wait_ms").get<std::int64_t>();
    if (wait_ms < 0) {
      return ConfigResult::err(core::ConfigError::kInvalidDocument);
    }
    config.max_rollback_wait = std::chrono::milliseconds{wait_ms};
  }

  return ConfigResult::ok(config);
}

}  // namespace uidkit::config
