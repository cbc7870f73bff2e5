#pragma once

#include "krazedb/storage/set_storage.h"

#include <map>
#include <mutex>
#include <set>
#include <string>

namespace krazedb::storage {

// InMemorySetStorage provides ISetStorage over std::map<std::string, std::set<std::string>>
// for tests and development.
//
// Mirrors Redis key lifecycle: a set whose last member is removed disappears, so
// list_keys() never reports empty collections.
// Thread-safety: coarse-grained std::mutex around every operation.
class InMemorySetStorage final : public ISetStorage {
 public:
  InMemorySetStorage() = default;
  ~InMemorySetStorage() override = default;

  // Disable copy/move (mutex not copyable)
  InMemorySetStorage(const InMemorySetStorage&) = delete;
  InMemorySetStorage& operator=(const InMemorySetStorage&) = delete;
  InMemorySetStorage(InMemorySetStorage&&) = delete;
  InMemorySetStorage& operator=(InMemorySetStorage&&) = delete;

  bool add_member(const std::string& key, const std::string& member) override;
  bool remove_member(const std::string& key, const std::string& member) override;
  [[nodiscard]] std::int64_t cardinality(const std::string& key) override;
  [[nodiscard]] std::vector<std::string> members(const std::string& key) override;
  bool delete_key(const std::string& key) override;
  [[nodiscard]] std::vector<std::string> list_keys(const std::string& pattern) override;
  void ping() override {}

 private:
  mutable std::mutex mutex_;
  std::map<std::string, std::set<std::string>> sets_;
};

// glob_match implements the subset of Redis MATCH patterns the store uses:
// '*' (any run), '?' (any one char), everything else literal.
[[nodiscard]] bool glob_match(const std::string& pattern, const std::string& text);

}  // namespace krazedb::storage
