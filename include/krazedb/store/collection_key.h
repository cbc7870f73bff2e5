#pragma once

#include <optional>
#include <string>
#include <utility>

namespace krazedb::store {

// Storage key layout:
//   domains          the single global collection
//   project:{name}   one collection per named project (flat prefix, no nesting)
inline constexpr const char* kGlobalCollectionKey = "domains";
inline constexpr const char* kProjectKeyPrefix = "project:";

// CollectionKey names the set one DomainStore operates on.
class CollectionKey {
 public:
  static CollectionKey global() { return CollectionKey{std::nullopt}; }
  static CollectionKey project(std::string name) { return CollectionKey{std::move(name)}; }

  // from_project_option maps an optional --project value onto a key.
  static CollectionKey from_project_option(const std::optional<std::string>& name) {
    return CollectionKey{name};
  }

  [[nodiscard]] std::string storage_key() const {
    return project_.has_value() ? std::string{kProjectKeyPrefix} + project_.value()
                                : std::string{kGlobalCollectionKey};
  }

  // Human-readable name for logs: the project name or "global".
  [[nodiscard]] std::string display_name() const { return project_.value_or("global"); }

  [[nodiscard]] const std::optional<std::string>& project_name() const { return project_; }

 private:
  explicit CollectionKey(std::optional<std::string> project) : project_(std::move(project)) {}

  std::optional<std::string> project_;
};

}  // namespace krazedb::store
