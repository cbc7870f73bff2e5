#pragma once

#include "krazedb/storage/redis_config.h"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace krazedb::config {

struct LoggingConfig {
  std::string level{"INFO"};        // NOLINT(readability-identifier-naming)
  std::optional<std::string> file;  // NOLINT(readability-identifier-naming)
};

// AppConfig is the fully resolved runtime configuration.
struct AppConfig {
  storage::RedisConfig redis;  // NOLINT(readability-identifier-naming)
  LoggingConfig logging;       // NOLINT(readability-identifier-naming)
};

// ConfigLoad carries the resolved config plus non-fatal problems found while resolving it.
// Warnings are surfaced once a logger exists.
struct ConfigLoad {
  AppConfig config;                   // NOLINT(readability-identifier-naming)
  std::vector<std::string> warnings;  // NOLINT(readability-identifier-naming)
};

// load_config_file merges a JSON config file over the defaults.
//
// File layout (every key optional):
//   {
//     "redis":   {"host": "...", "port": 6379, "db": 0, "max_connections": 10,
//                 "socket_timeout_ms": 1000},
//     "logging": {"level": "INFO", "file": "krazedb.log"}
//   }
//
// A missing path or missing file keeps the defaults silently. Unreadable files, malformed
// JSON and mistyped values produce warnings and keep the defaults for the affected keys.
[[nodiscard]] ConfigLoad load_config_file(const std::optional<std::string>& path);

// load_config_json merges an already-parsed JSON text over the defaults.
[[nodiscard]] ConfigLoad load_config_json(const std::string& json_text);

// EnvLookup returns the value of an environment variable, or nullopt when unset.
using EnvLookup = std::function<std::optional<std::string>(const std::string& name)>;

// process_env reads the real process environment.
[[nodiscard]] std::optional<std::string> process_env(const std::string& name);

// apply_env_overrides applies REDIS_HOST, REDIS_PORT and REDIS_DB on top of the config.
// Non-numeric port/db values are reported as warnings and ignored.
void apply_env_overrides(ConfigLoad& load, const EnvLookup& env);

}  // namespace krazedb::config
