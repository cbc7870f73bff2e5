#include "krazedb/storage/redis_set_storage.h"

#include "redis_options.h"

#include <iterator>
#include <stdexcept>
#include <sw/redis++/redis++.h>

namespace krazedb::storage {

namespace {

// SCAN page size hint; Redis may return more or fewer keys per call.
constexpr long long kScanCount = 100;

// Runs one redis++ call and translates its exceptions into SetStorageError.
template <typename Fn>
auto guarded(const char* command, Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const sw::redis::IoError& e) {
    // IoError also covers TimeoutError.
    throw SetStorageError(core::StorageError::kUnavailable,
                          std::string("Redis unreachable during ") + command + ": " + e.what());
  } catch (const sw::redis::ClosedError& e) {
    throw SetStorageError(core::StorageError::kUnavailable,
                          std::string("Redis connection closed during ") + command + ": " +
                              e.what());
  } catch (const sw::redis::Error& e) {
    throw SetStorageError(core::StorageError::kBackend,
                          std::string("Redis error during ") + command + ": " + e.what());
  }
}

}  // namespace

RedisSetStorage::RedisSetStorage(const RedisConfig& config) {
  try {
    sw::redis::ConnectionPoolOptions pool_options;
    pool_options.size = static_cast<std::size_t>(config.max_connections);

    redis_ = std::make_unique<sw::redis::Redis>(to_connection_options(config), pool_options);
    // Test connection
    redis_->ping();
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to connect to Redis at " + redis_config_to_log_string(config) +
                             ": " + std::string(e.what()));
  }
}

RedisSetStorage::~RedisSetStorage() = default;

bool RedisSetStorage::add_member(const std::string& key, const std::string& member) {
  return guarded("SADD", [&] { return redis_->sadd(key, member) > 0; });
}

bool RedisSetStorage::remove_member(const std::string& key, const std::string& member) {
  return guarded("SREM", [&] { return redis_->srem(key, member) > 0; });
}

std::int64_t RedisSetStorage::cardinality(const std::string& key) {
  return guarded("SCARD", [&] { return static_cast<std::int64_t>(redis_->scard(key)); });
}

std::vector<std::string> RedisSetStorage::members(const std::string& key) {
  return guarded("SMEMBERS", [&] {
    std::vector<std::string> result;
    redis_->smembers(key, std::back_inserter(result));
    return result;
  });
}

bool RedisSetStorage::delete_key(const std::string& key) {
  return guarded("DEL", [&] { return redis_->del(key) > 0; });
}

std::vector<std::string> RedisSetStorage::list_keys(const std::string& pattern) {
  return guarded("SCAN", [&] {
    std::vector<std::string> keys;
    long long cursor = 0;
    do {
      cursor = redis_->scan(cursor, pattern, kScanCount, std::back_inserter(keys));
    } while (cursor != 0);
    return keys;
  });
}

void RedisSetStorage::ping() {
  guarded("PING", [&] { redis_->ping(); });
}

}  // namespace krazedb::storage
