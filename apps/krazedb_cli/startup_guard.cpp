#include "startup_guard.h"

#include "krazedb/core/logger.h"

namespace krazedb::cli {

std::string validate_app_config(const config::AppConfig& config) {
  const auto& redis = config.redis;

  if (redis.host.empty()) {
    return "Error: redis.host must not be empty";
  }
  if (redis.port < 1 || redis.port > 65535) {
    return "Error: redis.port " + std::to_string(redis.port) + " is out of range (1-65535)";
  }
  if (redis.db < 0) {
    return "Error: redis.db must be >= 0";
  }
  if (redis.max_connections < 1) {
    return "Error: redis.max_connections must be >= 1";
  }
  if (redis.socket_timeout_ms < 1) {
    return "Error: redis.socket_timeout_ms must be >= 1";
  }
  if (!core::parse_log_level(config.logging.level).has_value()) {
    return "Error: logging.level '" + config.logging.level +
           "' is not one of DEBUG, INFO, WARNING, ERROR";
  }

  return "";
}

std::string validate_project_name(const std::optional<std::string>& project) {
  if (!project.has_value()) {
    return "";
  }

  const std::string& name = project.value();
  if (name.empty()) {
    return "Error: --project must not be empty";
  }
  for (const char c : name) {
    const bool allowed = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                         (c >= '0' && c <= '9') || c == '.' || c == '_' || c == '-';
    if (!allowed) {
      return "Error: --project '" + name + "' may only contain letters, digits, '.', '_' and '-'";
    }
  }

  return "";
}

}  // namespace krazedb::cli
