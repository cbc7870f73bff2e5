#include "krazedb/validation/domain_validator.h"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace krazedb::validation;

namespace {

void require_valid(const std::string& input, const std::string& expected) {
  INFO("input: " << input);
  const auto result = classify(input);
  REQUIRE(result.status == ValidationStatus::kValid);
  CHECK(result.domain == expected);
  CHECK_FALSE(result.reason.has_value());
}

void require_invalid(const std::string& input, const InvalidReason expected) {
  INFO("input: " << input);
  const auto result = classify(input);
  REQUIRE(result.status == ValidationStatus::kInvalid);
  REQUIRE(result.reason.has_value());
  CHECK(invalid_reason_name(result.reason.value()) == invalid_reason_name(expected));
  CHECK(result.domain.empty());
}

}  // namespace

// ── Accepted forms ──────────────────────────────────────────────────────────

TEST_CASE("classify: plain domains are valid", "[validation]") {
  require_valid("example.com", "example.com");
  require_valid("sub.domain.com", "sub.domain.com");
  require_valid("a1-b2.c3.example.org", "a1-b2.c3.example.org");
}

TEST_CASE("classify: leading wildcard label is valid", "[validation][wildcard]") {
  require_valid("*.example.com", "*.example.com");
}

TEST_CASE("classify: internal wildcard labels are valid", "[validation][wildcard]") {
  require_valid("svc-*.domain.com", "svc-*.domain.com");
  require_valid("rac-*.net.dell.com", "rac-*.net.dell.com");
  require_valid("test.*.invalid.com", "test.*.invalid.com");
}

TEST_CASE("classify: underscore service labels are valid", "[validation][service]") {
  require_valid("_service.domain.com", "_service.domain.com");
  require_valid("_collab-edge.5g.dell.com", "_collab-edge.5g.dell.com");
  require_valid("_sip._tcp.example.com", "_sip._tcp.example.com");
}

TEST_CASE("classify: output is lowercased and trimmed", "[validation]") {
  require_valid("  WWW.Example.COM\t", "www.example.com");
  require_valid("*.EXAMPLE.com", "*.example.com");
}

TEST_CASE("classify: 63-character label is accepted", "[validation]") {
  const std::string label(63, 'a');
  require_valid(label + ".com", label + ".com");
}

// ── Blank input ─────────────────────────────────────────────────────────────

TEST_CASE("classify: blank lines are skipped, not invalid", "[validation]") {
  CHECK(classify("").status == ValidationStatus::kSkipped);
  CHECK(classify("   ").status == ValidationStatus::kSkipped);
  CHECK(classify("\t\r\n").status == ValidationStatus::kSkipped);
  CHECK_FALSE(classify("  ").reason.has_value());
}

// ── Rejected forms ──────────────────────────────────────────────────────────

TEST_CASE("classify: wildcard glued to literal prefix is invalid", "[validation][wildcard]") {
  require_invalid("*abc.com", InvalidReason::kMalformedWildcard);
}

TEST_CASE("classify: wildcard label without TLD is invalid", "[validation][wildcard]") {
  require_invalid("svc-*", InvalidReason::kMalformedWildcard);
  require_invalid("*", InvalidReason::kMalformedWildcard);
}

TEST_CASE("classify: wildcard directly before the TLD is invalid", "[validation][wildcard]") {
  require_invalid("*.com", InvalidReason::kMalformedWildcard);
  require_invalid("a.svc-*.com", InvalidReason::kMalformedWildcard);
  require_invalid("example.c*m", InvalidReason::kMalformedWildcard);
}

TEST_CASE("classify: bare hyphen label is invalid", "[validation]") {
  require_invalid("-.example.com", InvalidReason::kInvalidLabel);
  require_invalid("-abc.example.com", InvalidReason::kInvalidLabel);
  require_invalid("abc-.example.com", InvalidReason::kInvalidLabel);
}

TEST_CASE("classify: scheme markers and paths are rejected", "[validation]") {
  require_invalid("http://example.com", InvalidReason::kProtocolOrPath);
  require_invalid("https://example.com", InvalidReason::kProtocolOrPath);
  require_invalid("example.com/path", InvalidReason::kProtocolOrPath);
}

TEST_CASE("classify: empty labels are rejected", "[validation]") {
  require_invalid(".example.com", InvalidReason::kEmptyLabel);
  require_invalid("example.com.", InvalidReason::kEmptyLabel);
  require_invalid("example..com", InvalidReason::kEmptyLabel);
  require_invalid("*..example.com", InvalidReason::kEmptyLabel);
}

TEST_CASE("classify: bad TLDs are rejected", "[validation]") {
  require_invalid("example.c", InvalidReason::kBadTld);
  require_invalid("example.c0m", InvalidReason::kBadTld);
  require_invalid("example._com", InvalidReason::kBadTld);
  require_invalid("10.0.0.1", InvalidReason::kBadTld);
}

TEST_CASE("classify: bare TLD is rejected", "[validation]") {
  require_invalid("com", InvalidReason::kTooFewLabels);
}

TEST_CASE("classify: over-long names are rejected", "[validation]") {
  require_invalid(std::string(64, 'a') + ".com", InvalidReason::kTooLong);

  std::string name;
  while (name.size() <= kMaxDomainLength) {
    name += "abcdefghij.";
  }
  name += "com";
  require_invalid(name, InvalidReason::kTooLong);
}

TEST_CASE("classify: illegal characters are rejected", "[validation]") {
  require_invalid("exa mple.com", InvalidReason::kInvalidLabel);
  require_invalid("ex!ample.com", InvalidReason::kInvalidLabel);
  require_invalid("a_b.example.com", InvalidReason::kInvalidLabel);
  require_invalid("_.example.com", InvalidReason::kInvalidLabel);
}

// ── Properties ──────────────────────────────────────────────────────────────

TEST_CASE("classify: normalization is idempotent", "[validation][property]") {
  const std::vector<std::string> inputs = {
      "Example.COM",    " *.Example.com ", "SVC-*.Domain.com", "_Service.domain.com",
      "test.*.x.co.uk", "a.b.c.d.e.example.io",
  };

  for (const auto& input : inputs) {
    INFO("input: " << input);
    const auto first = classify(input);
    REQUIRE(first.is_valid());
    const auto second = classify(first.domain);
    REQUIRE(second.is_valid());
    CHECK(second.domain == first.domain);
  }
}

TEST_CASE("invalid_reason_name: stable snake_case names", "[validation]") {
  CHECK(invalid_reason_name(InvalidReason::kProtocolOrPath) == "protocol_or_path");
  CHECK(invalid_reason_name(InvalidReason::kEmptyLabel) == "empty_label");
  CHECK(invalid_reason_name(InvalidReason::kBadTld) == "bad_tld");
  CHECK(invalid_reason_name(InvalidReason::kMalformedWildcard) == "malformed_wildcard");
  CHECK(invalid_reason_name(InvalidReason::kTooLong) == "too_long");
  CHECK(invalid_reason_name(InvalidReason::kInvalidLabel) == "invalid_label");
  CHECK(invalid_reason_name(InvalidReason::kTooFewLabels) == "too_few_labels");
}
