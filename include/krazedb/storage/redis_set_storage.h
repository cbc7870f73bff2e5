#pragma once

#include "krazedb/storage/redis_config.h"
#include "krazedb/storage/set_storage.h"

#include <memory>
#include <string>

// Forward declare Redis++ types to avoid exposing them in header
namespace sw {
namespace redis {
class Redis;
}  // namespace redis
}  // namespace sw

namespace krazedb::storage {

// RedisSetStorage implements ISetStorage on Redis sets through a pooled redis++ client.
//
// Command mapping:
//   add_member -> SADD     remove_member -> SREM    cardinality -> SCARD
//   members    -> SMEMBERS delete_key    -> DEL     list_keys   -> SCAN MATCH
//
// Pool: sw::redis::Redis owns a connection pool of config.max_connections connections,
// created in the constructor and released in the destructor.
// Errors: I/O, timeout and closed-connection failures map to StorageError::kUnavailable;
// any other redis++ error (e.g. WRONGTYPE, auth) maps to StorageError::kBackend.
class RedisSetStorage final : public ISetStorage {
 public:
  // Builds the pool and sends PING.
  // Throws std::runtime_error if the server is unreachable.
  explicit RedisSetStorage(const RedisConfig& config);

  ~RedisSetStorage() override;

  // Disable copy/move (unique_ptr to implementation)
  RedisSetStorage(const RedisSetStorage&) = delete;
  RedisSetStorage& operator=(const RedisSetStorage&) = delete;
  RedisSetStorage(RedisSetStorage&&) = delete;
  RedisSetStorage& operator=(RedisSetStorage&&) = delete;

  bool add_member(const std::string& key, const std::string& member) override;
  bool remove_member(const std::string& key, const std::string& member) override;
  [[nodiscard]] std::int64_t cardinality(const std::string& key) override;
  [[nodiscard]] std::vector<std::string> members(const std::string& key) override;
  bool delete_key(const std::string& key) override;
  [[nodiscard]] std::vector<std::string> list_keys(const std::string& pattern) override;
  void ping() override;

 private:
  std::unique_ptr<sw::redis::Redis> redis_;
};

}  // namespace krazedb::storage
