#include "krazedb/storage/inmemory_set_storage.h"

namespace krazedb::storage {

bool glob_match(const std::string& pattern, const std::string& text) {
  std::size_t p = 0;
  std::size_t t = 0;
  std::size_t star_p = std::string::npos;
  std::size_t star_t = 0;

  while (t < text.size()) {
    if (p < pattern.size() && (pattern[p] == '?' || pattern[p] == text[t])) {
      ++p;
      ++t;
    } else if (p < pattern.size() && pattern[p] == '*') {
      star_p = p++;
      star_t = t;
    } else if (star_p != std::string::npos) {
      p = star_p + 1;
      t = ++star_t;
    } else {
      return false;
    }
  }

  while (p < pattern.size() && pattern[p] == '*') {
    ++p;
  }
  return p == pattern.size();
}

bool InMemorySetStorage::add_member(const std::string& key, const std::string& member) {
  std::lock_guard<std::mutex> lock(mutex_);
  return sets_[key].insert(member).second;
}

bool InMemorySetStorage::remove_member(const std::string& key, const std::string& member) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = sets_.find(key);
  if (it == sets_.end()) {
    return false;
  }

  const bool removed = it->second.erase(member) > 0;
  if (it->second.empty()) {
    sets_.erase(it);
  }
  return removed;
}

std::int64_t InMemorySetStorage::cardinality(const std::string& key) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = sets_.find(key);
  if (it == sets_.end()) {
    return 0;
  }
  return static_cast<std::int64_t>(it->second.size());
}

std::vector<std::string> InMemorySetStorage::members(const std::string& key) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = sets_.find(key);
  if (it == sets_.end()) {
    return {};
  }
  return {it->second.begin(), it->second.end()};
}

bool InMemorySetStorage::delete_key(const std::string& key) {
  std::lock_guard<std::mutex> lock(mutex_);
  return sets_.erase(key) > 0;
}

std::vector<std::string> InMemorySetStorage::list_keys(const std::string& pattern) {
  std::lock_guard<std::mutex> lock(mutex_);

  std::vector<std::string> keys;
  for (const auto& [key, members] : sets_) {
    if (glob_match(pattern, key)) {
      keys.push_back(key);
    }
  }
  return keys;
}

}  // namespace krazedb::storage
