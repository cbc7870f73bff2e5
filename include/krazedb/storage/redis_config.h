#pragma once

#include <optional>
#include <string>

namespace krazedb::storage {

// RedisConfig is the resolved connection configuration for the Redis set storage.
// Every field has a default matching a stock local Redis.
struct RedisConfig {
  std::string host{"localhost"};  // NOLINT(readability-identifier-naming)
  int port{6379};                 // NOLINT(readability-identifier-naming)
  int db{0};                      // NOLINT(readability-identifier-naming)
  int max_connections{10};        // NOLINT(readability-identifier-naming)
  int socket_timeout_ms{1000};    // NOLINT(readability-identifier-naming)
};

// parse_redis_uri attempts to parse a Redis URI string into host/port/db.
// Pool and timeout fields keep their defaults.
//
// Accepts: tcp://host:port, redis://host:port, tcp://host, redis://host:port/N
// Rejects: empty string, no recognised scheme, missing host, invalid port, invalid /N
//
// The /N database suffix is only meaningful for redis:// URIs; tcp:// URIs always use db 0.
[[nodiscard]] std::optional<RedisConfig> parse_redis_uri(const std::string& uri);

// redis_config_to_log_string returns a deterministic, human-readable
// representation of a RedisConfig for startup diagnostics.
// Format: "host:port" or "host:port/db" when db is not 0.
[[nodiscard]] std::string redis_config_to_log_string(const RedisConfig& config);

}  // namespace krazedb::storage
