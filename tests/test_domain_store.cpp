#include "krazedb/core/clock.h"
#include "krazedb/core/logger.h"
#include "krazedb/storage/inmemory_set_storage.h"
#include "krazedb/store/domain_store.h"

#include <catch2/catch_test_macros.hpp>

#include <sstream>
#include <string>
#include <utility>
#include <vector>

using namespace krazedb;

namespace {

// Fixture bundles the collaborators a DomainStore borrows.
struct StoreFixture {
  storage::InMemorySetStorage storage;
  core::FixedClock clock{"2026-01-01T00:00:00Z"};
  std::ostringstream log;
  core::Logger logger{core::LogLevel::kDebug, clock};

  StoreFixture() { logger.add_sink(log); }

  store::DomainStore make_store(store::CollectionKey key = store::CollectionKey::global()) {
    return store::DomainStore(storage, std::move(key), logger, clock);
  }
};

}  // namespace

// ── add ─────────────────────────────────────────────────────────────────────

TEST_CASE("DomainStore::add: new entries are counted as added", "[store][add]") {
  StoreFixture fx;
  auto domain_store = fx.make_store();

  const auto report = domain_store.add({"example.com", "sub.domain.com", "*.example.com"});

  CHECK(report.added == 3);
  CHECK(report.duplicate == 0);
  CHECK(report.invalid == 0);
  CHECK_FALSE(report.failure.has_value());
  CHECK(fx.storage.cardinality("domains") == 3);
}

TEST_CASE("DomainStore::add: repeated entries are duplicates", "[store][add]") {
  StoreFixture fx;
  auto domain_store = fx.make_store();

  const auto first = domain_store.add({"a.com"});
  CHECK(first.added == 1);

  const auto second = domain_store.add({"a.com", "A.COM", "  a.com  "});
  CHECK(second.added == 0);
  CHECK(second.duplicate == 3);

  const auto count = domain_store.count();
  REQUIRE(count.has_value());
  CHECK(count.value() == 1);
}

TEST_CASE("DomainStore::add: mixed batch reports each category", "[store][add]") {
  StoreFixture fx;
  auto domain_store = fx.make_store();
  (void)domain_store.add({"a.com"});

  const auto report = domain_store.add({"a.com", "b.com", "*abc.com"});

  CHECK(report.added == 1);
  CHECK(report.duplicate == 1);
  CHECK(report.invalid == 1);
  CHECK(report.processed() == 2);
  REQUIRE(report.invalid_entries.size() == 1);
  CHECK(report.invalid_entries[0].line_number == 3);
  CHECK(report.invalid_entries[0].line == "*abc.com");
  CHECK(report.invalid_entries[0].reason == validation::InvalidReason::kMalformedWildcard);

  // The rejected line never reaches storage.
  const auto listed = domain_store.list();
  REQUIRE(listed.has_value());
  CHECK(listed.value() == std::vector<std::string>{"a.com", "b.com"});
}

TEST_CASE("DomainStore::add: blank lines are neither added nor invalid", "[store][add]") {
  StoreFixture fx;
  auto domain_store = fx.make_store();

  const auto report = domain_store.add({"", "   ", "a.com", "\t"});

  CHECK(report.added == 1);
  CHECK(report.duplicate == 0);
  CHECK(report.invalid == 0);
}

TEST_CASE("DomainStore::add: invalid lines are logged with line number", "[store][add]") {
  StoreFixture fx;
  auto domain_store = fx.make_store();

  (void)domain_store.add({"ok.com", "http://bad.com"});

  const std::string log = fx.log.str();
  CHECK(log.find("WARNING - Invalid domain 'http://bad.com' on line 2 (protocol_or_path)") !=
        std::string::npos);
}

TEST_CASE("DomainStore::add: counts sum to non-blank input", "[store][add][property]") {
  StoreFixture fx;
  auto domain_store = fx.make_store();

  const std::vector<std::string> batch = {"a.com", "b.com", "a.com", "", "bad..com",
                                          "c.com", "C.com", "x",     "  "};
  const auto report = domain_store.add(batch);

  CHECK(report.added + report.duplicate + report.invalid == 7);
  CHECK(report.added == 3);
  CHECK(report.duplicate == 2);
  CHECK(report.invalid == 2);
}

TEST_CASE("DomainStore::add: validation disabled stores normalized text", "[store][add]") {
  StoreFixture fx;
  auto domain_store = fx.make_store();

  const auto report =
      domain_store.add({"  Not_A_Domain  ", "http://x.com", ""}, {.validate = false});

  CHECK(report.added == 2);
  CHECK(report.invalid == 0);
  const auto listed = domain_store.list();
  REQUIRE(listed.has_value());
  CHECK(listed.value() == std::vector<std::string>{"http://x.com", "not_a_domain"});
}

// ── remove ──────────────────────────────────────────────────────────────────

TEST_CASE("DomainStore::remove: present targets are removed", "[store][remove]") {
  StoreFixture fx;
  auto domain_store = fx.make_store();
  (void)domain_store.add({"a.com", "b.com", "c.com"});

  const auto report = domain_store.remove({"a.com", "C.COM"});

  CHECK(report.removed == 2);
  CHECK(report.not_found == 0);
  CHECK_FALSE(report.failure.has_value());
  const auto listed = domain_store.list();
  REQUIRE(listed.has_value());
  CHECK(listed.value() == std::vector<std::string>{"b.com"});
}

TEST_CASE("DomainStore::remove: absent target is not found, set unchanged", "[store][remove]") {
  StoreFixture fx;
  auto domain_store = fx.make_store();
  (void)domain_store.add({"a.com"});

  const auto report = domain_store.remove({"missing.com"});

  CHECK(report.removed == 0);
  CHECK(report.not_found == 1);
  REQUIRE(report.not_found_domains.size() == 1);
  CHECK(report.not_found_domains[0] == "missing.com");
  CHECK_FALSE(report.failure.has_value());

  const auto count = domain_store.count();
  REQUIRE(count.has_value());
  CHECK(count.value() == 1);
  CHECK(fx.log.str().find("Domain 'missing.com' not found in global collection") !=
        std::string::npos);
}

TEST_CASE("DomainStore::remove: targets are not validated", "[store][remove]") {
  StoreFixture fx;
  auto domain_store = fx.make_store();
  (void)domain_store.add({"odd_entry"}, {.validate = false});

  const auto report = domain_store.remove({"odd_entry", ""});

  CHECK(report.removed == 1);
  CHECK(report.not_found == 0);
}

// ── count / list ────────────────────────────────────────────────────────────

TEST_CASE("DomainStore::count: absent collection counts zero", "[store][count]") {
  StoreFixture fx;
  auto domain_store = fx.make_store();

  const auto count = domain_store.count();
  REQUIRE(count.has_value());
  CHECK(count.value() == 0);
}

TEST_CASE("DomainStore::list: entries come back sorted", "[store][list]") {
  StoreFixture fx;
  auto domain_store = fx.make_store();
  (void)domain_store.add({"zeta.com", "alpha.com", "*.mid.com", "beta.org"});

  const auto listed = domain_store.list();
  REQUIRE(listed.has_value());
  const std::vector<std::string> expected = {"*.mid.com", "alpha.com", "beta.org", "zeta.com"};
  CHECK(listed.value() == expected);
}

TEST_CASE("DomainStore::list: absent collection is empty", "[store][list]") {
  StoreFixture fx;
  auto domain_store = fx.make_store(store::CollectionKey::project("nothing-here"));

  const auto listed = domain_store.list();
  REQUIRE(listed.has_value());
  CHECK(listed.value().empty());
}

// ── collections ─────────────────────────────────────────────────────────────

TEST_CASE("DomainStore: project collections are isolated from global", "[store][project]") {
  StoreFixture fx;
  auto global = fx.make_store();
  auto acme = fx.make_store(store::CollectionKey::project("acme"));

  (void)global.add({"a.com"});
  (void)acme.add({"a.com", "b.com"});

  CHECK(fx.storage.cardinality("domains") == 1);
  CHECK(fx.storage.cardinality("project:acme") == 2);

  (void)acme.remove({"a.com"});
  const auto global_count = global.count();
  REQUIRE(global_count.has_value());
  CHECK(global_count.value() == 1);
}

TEST_CASE("CollectionKey: storage keys and display names", "[store][project]") {
  CHECK(store::CollectionKey::global().storage_key() == "domains");
  CHECK(store::CollectionKey::global().display_name() == "global");
  CHECK(store::CollectionKey::project("acme").storage_key() == "project:acme");
  CHECK(store::CollectionKey::project("acme").display_name() == "acme");
  CHECK(store::CollectionKey::from_project_option(std::nullopt).storage_key() == "domains");
  CHECK(store::CollectionKey::from_project_option(std::string{"x"}).storage_key() ==
        "project:x");
}

TEST_CASE("list_projects: names are stripped of the key prefix and sorted", "[store][project]") {
  StoreFixture fx;
  (void)fx.make_store().add({"g.com"});
  (void)fx.make_store(store::CollectionKey::project("zeta")).add({"z.com"});
  (void)fx.make_store(store::CollectionKey::project("acme")).add({"a.com"});

  const auto projects = store::list_projects(fx.storage);
  REQUIRE(projects.has_value());
  CHECK(projects.value() == std::vector<std::string>{"acme", "zeta"});
}

TEST_CASE("list_projects: empty storage yields no projects", "[store][project]") {
  storage::InMemorySetStorage storage;

  const auto projects = store::list_projects(storage);
  REQUIRE(projects.has_value());
  CHECK(projects.value().empty());
}

// ── delete_collection ───────────────────────────────────────────────────────

TEST_CASE("DomainStore::delete_collection: unconfirmed leaves collection unchanged",
          "[store][delete]") {
  StoreFixture fx;
  auto domain_store = fx.make_store();
  (void)domain_store.add({"a.com", "b.com"});

  const auto result = domain_store.delete_collection(store::DeleteConfirmation::kUnconfirmed);

  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().kind == store::StoreErrorKind::kConfirmationRequired);
  const auto count = domain_store.count();
  REQUIRE(count.has_value());
  CHECK(count.value() == 2);
}

TEST_CASE("DomainStore::delete_collection: confirmed empties the collection",
          "[store][delete]") {
  StoreFixture fx;
  auto domain_store = fx.make_store();
  (void)domain_store.add({"a.com", "b.com", "c.com"});

  const auto result = domain_store.delete_collection(store::DeleteConfirmation::kConfirmed);

  REQUIRE(result.has_value());
  CHECK(result.value().existed);
  CHECK(result.value().deleted_entries == 3);
  const auto count = domain_store.count();
  REQUIRE(count.has_value());
  CHECK(count.value() == 0);
}

TEST_CASE("DomainStore::delete_collection: absent collection is not an error",
          "[store][delete]") {
  StoreFixture fx;
  auto domain_store = fx.make_store(store::CollectionKey::project("ghost"));

  const auto result = domain_store.delete_collection(store::DeleteConfirmation::kConfirmed);

  REQUIRE(result.has_value());
  CHECK_FALSE(result.value().existed);
  CHECK(result.value().deleted_entries == 0);
}

TEST_CASE("DomainStore::delete_collection: other collections survive", "[store][delete]") {
  StoreFixture fx;
  auto global = fx.make_store();
  auto acme = fx.make_store(store::CollectionKey::project("acme"));
  (void)global.add({"a.com"});
  (void)acme.add({"b.com"});

  REQUIRE(acme.delete_collection(store::DeleteConfirmation::kConfirmed).has_value());

  CHECK(fx.storage.cardinality("domains") == 1);
  CHECK(fx.storage.cardinality("project:acme") == 0);
}
