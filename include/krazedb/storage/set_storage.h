#pragma once

#include "krazedb/core/result.h"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace krazedb::storage {

// SetStorageError is thrown by ISetStorage implementations when the backing service fails.
// kind() separates "service unreachable" from "service answered with an error"; logical
// absence (missing key, missing member) is never reported through this exception.
class SetStorageError : public std::runtime_error {
 public:
  SetStorageError(core::StorageError kind, const std::string& message)
      : std::runtime_error(message), kind_(kind) {}

  [[nodiscard]] core::StorageError kind() const { return kind_; }

 private:
  core::StorageError kind_;
};

// ISetStorage is the set-per-key service contract the domain store is written against.
//
// Semantics:
// - add_member / remove_member are idempotent: adding an existing member or removing an
//   absent one is a no-op that returns false, not an error.
// - An absent key behaves as an empty set (cardinality 0, no members).
// - members() order is unspecified; callers sort.
// - Every method throws SetStorageError on backend failure.
class ISetStorage {
 public:
  virtual ~ISetStorage() = default;

  // Returns true if the member was newly inserted.
  virtual bool add_member(const std::string& key, const std::string& member) = 0;

  // Returns true if the member was present and has been removed.
  virtual bool remove_member(const std::string& key, const std::string& member) = 0;

  [[nodiscard]] virtual std::int64_t cardinality(const std::string& key) = 0;

  [[nodiscard]] virtual std::vector<std::string> members(const std::string& key) = 0;

  // Returns true if the key existed.
  virtual bool delete_key(const std::string& key) = 0;

  // list_keys returns keys matching a glob-style pattern ("project:*"). Order unspecified.
  [[nodiscard]] virtual std::vector<std::string> list_keys(const std::string& pattern) = 0;

  // ping verifies the service is reachable; throws SetStorageError otherwise.
  virtual void ping() = 0;

 protected:
  ISetStorage() = default;
  ISetStorage(const ISetStorage&) = default;
  ISetStorage& operator=(const ISetStorage&) = default;
  ISetStorage(ISetStorage&&) = default;
  ISetStorage& operator=(ISetStorage&&) = default;
};

}  // namespace krazedb::storage
