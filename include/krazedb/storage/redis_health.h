#pragma once

#include "krazedb/storage/redis_config.h"

#include <string>

namespace krazedb::storage {

// RedisHealthResult holds the outcome of a redis_ping() call.
struct RedisHealthResult {
  bool reachable{false};  // NOLINT(readability-identifier-naming)
  std::string error;      // NOLINT(readability-identifier-naming)
};

// redis_ping opens a single direct connection (no pool), sends PING, and returns the result.
// Never mutates data and never throws; all errors are reported in RedisHealthResult.error.
[[nodiscard]] RedisHealthResult redis_ping(const RedisConfig& config);

}  // namespace krazedb::storage
