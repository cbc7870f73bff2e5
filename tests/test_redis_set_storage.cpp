#include "krazedb/core/clock.h"
#include "krazedb/core/logger.h"
#include "krazedb/storage/redis_config.h"
#include "krazedb/storage/redis_health.h"
#include "krazedb/storage/redis_set_storage.h"
#include "krazedb/store/domain_store.h"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <vector>

using namespace krazedb;

// Helper: Check if Redis integration tests should run
static bool should_run_redis_tests() {
  const char* env = std::getenv("KRAZEDB_TEST_REDIS");
  return env != nullptr && std::string(env) == "1";
}

// Helper: Get Redis config from KRAZEDB_REDIS_URI or use default
static storage::RedisConfig get_redis_config() {
  const char* env = std::getenv("KRAZEDB_REDIS_URI");
  const std::string uri = env != nullptr ? std::string(env) : "tcp://127.0.0.1:6379";
  const auto parsed = storage::parse_redis_uri(uri);
  if (!parsed.has_value()) {
    throw std::runtime_error("KRAZEDB_REDIS_URI is not a valid Redis URI: " + uri);
  }
  return parsed.value();
}

TEST_CASE("RedisSetStorage: member lifecycle against a live server",
          "[storage][redis][integration]") {
  if (!should_run_redis_tests()) {
    SKIP("Redis integration tests disabled (set KRAZEDB_TEST_REDIS=1 to enable)");
  }

  storage::RedisSetStorage storage(get_redis_config());
  const std::string key = "project:krazedb-test-lifecycle";
  storage.delete_key(key);

  CHECK(storage.add_member(key, "a.com"));
  CHECK_FALSE(storage.add_member(key, "a.com"));
  CHECK(storage.add_member(key, "b.com"));
  CHECK(storage.cardinality(key) == 2);

  auto members = storage.members(key);
  std::sort(members.begin(), members.end());
  CHECK(members == std::vector<std::string>{"a.com", "b.com"});

  CHECK(storage.remove_member(key, "a.com"));
  CHECK_FALSE(storage.remove_member(key, "a.com"));

  CHECK(storage.delete_key(key));
  CHECK(storage.cardinality(key) == 0);
  CHECK_FALSE(storage.delete_key(key));
}

TEST_CASE("RedisSetStorage: list_keys finds project collections",
          "[storage][redis][integration]") {
  if (!should_run_redis_tests()) {
    SKIP("Redis integration tests disabled (set KRAZEDB_TEST_REDIS=1 to enable)");
  }

  storage::RedisSetStorage storage(get_redis_config());
  const std::string key = "project:krazedb-test-scan";
  storage.add_member(key, "a.com");

  const auto keys = storage.list_keys("project:krazedb-test-*");
  CHECK(std::find(keys.begin(), keys.end(), key) != keys.end());

  storage.delete_key(key);
}

TEST_CASE("RedisSetStorage: DomainStore end to end", "[store][redis][integration]") {
  if (!should_run_redis_tests()) {
    SKIP("Redis integration tests disabled (set KRAZEDB_TEST_REDIS=1 to enable)");
  }

  storage::RedisSetStorage storage(get_redis_config());
  core::FixedClock clock{"2026-01-01T00:00:00Z"};
  core::Logger logger{core::LogLevel::kError, clock};
  store::DomainStore domains{storage, store::CollectionKey::project("krazedb-test-e2e"), logger,
                             clock};
  REQUIRE(domains.delete_collection(store::DeleteConfirmation::kConfirmed).has_value());

  const auto added = domains.add({"b.com", "a.com", "a.com", "*abc.com"});
  CHECK(added.added == 2);
  CHECK(added.duplicate == 1);
  CHECK(added.invalid == 1);
  CHECK_FALSE(added.failure.has_value());

  const auto listed = domains.list();
  REQUIRE(listed.has_value());
  CHECK(listed.value() == std::vector<std::string>{"a.com", "b.com"});

  const auto deleted = domains.delete_collection(store::DeleteConfirmation::kConfirmed);
  REQUIRE(deleted.has_value());
  CHECK(deleted.value().deleted_entries == 2);
}

TEST_CASE("RedisSetStorage: unreachable server throws on construction",
          "[storage][redis][integration]") {
  if (!should_run_redis_tests()) {
    SKIP("Redis integration tests disabled (set KRAZEDB_TEST_REDIS=1 to enable)");
  }

  storage::RedisConfig config;
  config.host = "127.0.0.1";
  config.port = 1;
  config.socket_timeout_ms = 200;

  CHECK_THROWS_AS(storage::RedisSetStorage(config), std::runtime_error);

  const auto health = storage::redis_ping(config);
  CHECK_FALSE(health.reachable);
  CHECK_FALSE(health.error.empty());
}
