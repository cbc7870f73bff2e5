#pragma once

#include <string>
#include <string_view>

namespace krazedb::core {

// Deterministic ASCII-only normalization helpers.
// Locale-independent: no std::tolower / std::isspace, so output is byte-stable everywhere.

inline bool is_ascii_space(const char ch) {
  return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\v' || ch == '\f';
}

inline bool is_ascii_alpha_lower(const char ch) { return ch >= 'a' && ch <= 'z'; }

inline bool is_ascii_digit(const char ch) { return ch >= '0' && ch <= '9'; }

// normalize_ascii_lower converts ASCII uppercase (A-Z) to lowercase (a-z).
// Non-ASCII bytes are preserved unchanged.
inline std::string normalize_ascii_lower(const std::string_view input) {
  std::string result;
  result.reserve(input.size());

  for (const char ch : input) {
    if (ch >= 'A' && ch <= 'Z') {
      constexpr char kCaseOffset = 'a' - 'A';
      result.push_back(static_cast<char>(ch + kCaseOffset));
    } else {
      result.push_back(ch);
    }
  }

  return result;
}

// trim removes leading and trailing ASCII whitespace.
inline std::string trim(const std::string_view input) {
  std::size_t start = 0;
  while (start < input.size() && is_ascii_space(input[start])) {
    ++start;
  }

  std::size_t end = input.size();
  while (end > start && is_ascii_space(input[end - 1])) {
    --end;
  }

  return std::string{input.substr(start, end - start)};
}

// normalize_entry is the storage form of a domain line: trimmed and lowercased.
inline std::string normalize_entry(const std::string_view input) {
  return normalize_ascii_lower(trim(input));
}

}  // namespace krazedb::core
