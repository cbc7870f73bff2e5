#pragma once

#include "krazedb/core/clock.h"
#include "krazedb/core/logger.h"
#include "krazedb/core/result.h"
#include "krazedb/storage/set_storage.h"
#include "krazedb/store/collection_key.h"
#include "krazedb/store/store_reports.h"

#include <string>
#include <vector>

namespace krazedb::store {

struct AddOptions {
  bool validate{true};  // when false, lines are only trimmed and lowercased
};

enum class DeleteConfirmation {
  kUnconfirmed,
  kConfirmed,
};

// DomainStore manages one deduplicated collection of domain entries.
//
// Responsibilities:
// - Classify add input with validation::classify (unless disabled)
// - Insert/remove entries one at a time, isolating per-entry outcomes
// - Present sorted views (list, export) over the unordered backing set
// - Guard collection deletion behind an explicit confirmation
//
// Error model:
// - Logical absence (missing collection, missing member) is a normal result.
// - A storage failure stops the current operation. Batch operations carry it in
//   report.failure with the counts accumulated so far; the other operations return
//   Result::err(StoreFailure).
//
// The store borrows its storage, logger and clock; the caller owns all three.
class DomainStore {
 public:
  DomainStore(storage::ISetStorage& storage, CollectionKey collection, core::Logger& logger,
              core::IClock& clock);

  [[nodiscard]] AddReport add(const std::vector<std::string>& lines,
                              const AddOptions& options = {});

  // remove applies no validation: any non-blank line is attempted.
  [[nodiscard]] RemoveReport remove(const std::vector<std::string>& lines);

  // count returns 0 for an absent collection.
  [[nodiscard]] core::Result<std::int64_t, StoreFailure> count();

  // list returns entries in lexicographic order; empty for an absent collection.
  [[nodiscard]] core::Result<std::vector<std::string>, StoreFailure> list();

  // export_snapshot renders a sorted point-in-time copy.
  //   kText: one entry per line, each followed by '\n'
  //   kJson: {"domain_count": N, "exported_at": "<iso8601>", "domains": [...]}, indent 2
  [[nodiscard]] core::Result<ExportArtifact, StoreFailure> export_snapshot(ExportFormat format);

  // delete_collection drops every entry in one call. Without kConfirmed it returns
  // kConfirmationRequired and does not touch storage.
  [[nodiscard]] core::Result<DeleteReport, StoreFailure> delete_collection(
      DeleteConfirmation confirmation);

  [[nodiscard]] const CollectionKey& collection() const { return collection_; }

 private:
  storage::ISetStorage& storage_;
  CollectionKey collection_;
  std::string key_;
  core::Logger& logger_;
  core::IClock& clock_;
};

// list_projects enumerates project collections present in storage, sorted and unique.
[[nodiscard]] core::Result<std::vector<std::string>, StoreFailure> list_projects(
    storage::ISetStorage& storage);

// render_json_export builds the JSON export document for already-sorted entries.
[[nodiscard]] std::string render_json_export(const std::vector<std::string>& sorted_domains,
                                             const std::string& exported_at);

// render_text_export joins already-sorted entries one per line.
[[nodiscard]] std::string render_text_export(const std::vector<std::string>& sorted_domains);

}  // namespace krazedb::store
