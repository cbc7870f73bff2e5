#include "krazedb/validation/domain_validator.h"

#include "krazedb/core/normalization.h"

#include <vector>

namespace krazedb::validation {

namespace {

bool is_literal_char(const char ch) {
  return core::is_ascii_alpha_lower(ch) || core::is_ascii_digit(ch) || ch == '-';
}

// [a-z0-9-]+ without a leading or trailing hyphen. Expects lowercased input.
// When allow_star is set, '*' counts as a literal character.
bool is_literal_label(const std::string_view label, const bool allow_star = false) {
  if (label.empty() || label.front() == '-' || label.back() == '-') {
    return false;
  }
  for (const char ch : label) {
    if (!is_literal_char(ch) && !(allow_star && ch == '*')) {
      return false;
    }
  }
  return true;
}

// Labels are split on '.', keeping empty pieces so that "a..b" and ".a" are detectable.
std::vector<std::string_view> split_labels(const std::string_view name) {
  std::vector<std::string_view> labels;
  std::size_t start = 0;
  while (true) {
    const std::size_t dot = name.find('.', start);
    if (dot == std::string_view::npos) {
      labels.push_back(name.substr(start));
      break;
    }
    labels.push_back(name.substr(start, dot - start));
    start = dot + 1;
  }
  return labels;
}

std::optional<InvalidReason> check_inner_label(const std::string_view label) {
  if (label.find('*') != std::string_view::npos) {
    if (label == "*") {
      return std::nullopt;
    }
    // "*abc" glues the wildcard to literal characters as a prefix.
    if (label.front() == '*' || !is_literal_label(label, true)) {
      return InvalidReason::kMalformedWildcard;
    }
    return std::nullopt;
  }

  if (label.front() == '_') {
    if (is_literal_label(label.substr(1))) {
      return std::nullopt;
    }
    return InvalidReason::kInvalidLabel;
  }

  if (!is_literal_label(label)) {
    return InvalidReason::kInvalidLabel;
  }
  return std::nullopt;
}

std::optional<InvalidReason> check_tld(const std::string_view tld) {
  if (tld.find('*') != std::string_view::npos) {
    return InvalidReason::kMalformedWildcard;
  }
  if (tld.size() < 2) {
    return InvalidReason::kBadTld;
  }
  for (const char ch : tld) {
    if (!core::is_ascii_alpha_lower(ch)) {
      return InvalidReason::kBadTld;
    }
  }
  return std::nullopt;
}

}  // namespace

std::string invalid_reason_name(const InvalidReason reason) {
  switch (reason) {
    case InvalidReason::kProtocolOrPath:
      return "protocol_or_path";
    case InvalidReason::kEmptyLabel:
      return "empty_label";
    case InvalidReason::kBadTld:
      return "bad_tld";
    case InvalidReason::kMalformedWildcard:
      return "malformed_wildcard";
    case InvalidReason::kTooLong:
      return "too_long";
    case InvalidReason::kInvalidLabel:
      return "invalid_label";
    case InvalidReason::kTooFewLabels:
      return "too_few_labels";
  }
  return "invalid_label";
}

ValidationResult classify(const std::string_view line) {
  const std::string name = core::normalize_entry(line);
  if (name.empty()) {
    return ValidationResult::skipped();
  }

  // '/' covers both "http://" / "https://" scheme markers and URL paths.
  if (name.find('/') != std::string::npos) {
    return ValidationResult::invalid(InvalidReason::kProtocolOrPath);
  }

  if (name.size() > kMaxDomainLength) {
    return ValidationResult::invalid(InvalidReason::kTooLong);
  }

  const std::vector<std::string_view> labels = split_labels(name);

  for (const auto& label : labels) {
    if (label.empty()) {
      return ValidationResult::invalid(InvalidReason::kEmptyLabel);
    }
    if (label.size() > kMaxLabelLength) {
      return ValidationResult::invalid(InvalidReason::kTooLong);
    }
  }

  for (std::size_t i = 0; i + 1 < labels.size(); ++i) {
    if (const auto reason = check_inner_label(labels[i])) {
      return ValidationResult::invalid(*reason);
    }
  }

  if (const auto reason = check_tld(labels.back())) {
    return ValidationResult::invalid(*reason);
  }

  if (labels.size() < 2) {
    return ValidationResult::invalid(InvalidReason::kTooFewLabels);
  }

  // Every wildcard label needs a literal label between it and the TLD; checking the
  // label right before the TLD is sufficient.
  if (labels[labels.size() - 2].find('*') != std::string_view::npos) {
    return ValidationResult::invalid(InvalidReason::kMalformedWildcard);
  }

  return ValidationResult::valid(name);
}

}  // namespace krazedb::validation
