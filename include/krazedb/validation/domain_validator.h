#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace krazedb::validation {

// InvalidReason is the closed set of rejection causes for a domain line.
// Callers branch on the tag; invalid_reason_name() gives the stable snake_case spelling
// used in reports and logs.
enum class InvalidReason {
  kProtocolOrPath,     // contains a scheme marker or a '/' path separator
  kEmptyLabel,         // leading, trailing or doubled dot
  kBadTld,             // final label not alphabetic or shorter than 2
  kMalformedWildcard,  // '*' glued as a prefix, in the TLD, or not followed by a literal label
  kTooLong,            // label > 63 or name > 253 characters
  kInvalidLabel,       // bad character or hyphen placement in a non-wildcard label
  kTooFewLabels,       // a bare TLD
};

[[nodiscard]] std::string invalid_reason_name(InvalidReason reason);

enum class ValidationStatus {
  kValid,
  kInvalid,
  kSkipped,  // blank line: ignored, not counted as invalid
};

// ValidationResult is the outcome of classify().
// kValid:   domain holds the normalized (lowercased) name, reason is empty.
// kInvalid: reason is set, domain is empty.
// kSkipped: both empty.
struct ValidationResult {
  ValidationStatus status{ValidationStatus::kSkipped};
  std::string domain;
  std::optional<InvalidReason> reason;

  [[nodiscard]] bool is_valid() const { return status == ValidationStatus::kValid; }

  static ValidationResult valid(std::string normalized) {
    return ValidationResult{ValidationStatus::kValid, std::move(normalized), std::nullopt};
  }
  static ValidationResult invalid(InvalidReason why) {
    return ValidationResult{ValidationStatus::kInvalid, {}, why};
  }
  static ValidationResult skipped() { return ValidationResult{}; }
};

inline constexpr std::size_t kMaxDomainLength = 253;
inline constexpr std::size_t kMaxLabelLength = 63;

// classify checks one input line against the domain grammar.
//
// Accepted forms:
//   example.com, sub.domain.com      literal labels
//   *.example.com                    leading wildcard label
//   svc-*.domain.com, test.*.x.com   wildcard labels followed by a literal label and a TLD
//   _service.domain.com              underscore-prefixed service labels
//
// Pure and deterministic; never throws. Whitespace around the line is ignored and the
// accepted name is returned lowercased.
[[nodiscard]] ValidationResult classify(std::string_view line);

}  // namespace krazedb::validation
