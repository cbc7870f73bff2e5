#pragma once

#include "krazedb/storage/redis_config.h"

#include <chrono>
#include <sw/redis++/redis++.h>

namespace krazedb::storage {

// to_connection_options maps RedisConfig onto redis++ connection options.
// Shared by the pooled set storage and the one-shot health check.
inline sw::redis::ConnectionOptions to_connection_options(const RedisConfig& config) {
  sw::redis::ConnectionOptions options;
  options.host = config.host;
  options.port = config.port;
  options.db = config.db;
  options.connect_timeout = std::chrono::milliseconds(config.socket_timeout_ms);
  options.socket_timeout = std::chrono::milliseconds(config.socket_timeout_ms);
  return options;
}

}  // namespace krazedb::storage
