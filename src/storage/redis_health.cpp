#include "krazedb/storage/redis_health.h"

#include "redis_options.h"

#include <sw/redis++/redis++.h>

namespace krazedb::storage {

RedisHealthResult redis_ping(const RedisConfig& config) {
  try {
    sw::redis::Redis redis(to_connection_options(config));
    redis.ping();
    return RedisHealthResult{true, ""};
  } catch (const std::exception& e) {
    return RedisHealthResult{false, e.what()};
  }
}

}  // namespace krazedb::storage
