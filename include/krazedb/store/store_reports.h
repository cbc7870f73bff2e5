#pragma once

#include "krazedb/validation/domain_validator.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace krazedb::store {

// StoreErrorKind separates fatal storage failures from the delete confirmation guard.
enum class StoreErrorKind {
  kConnection,            // storage service unreachable
  kBackend,               // storage service answered with an error
  kConfirmationRequired,  // destructive operation attempted without confirmation
};

struct StoreFailure {
  StoreErrorKind kind;
  std::string message;
};

// InvalidEntry records one rejected add line.
struct InvalidEntry {
  std::size_t line_number{0};  // 1-based position in the input batch
  std::string line;            // trimmed input text
  validation::InvalidReason reason{validation::InvalidReason::kInvalidLabel};
};

// AddReport summarises a batch add.
// Invariant when failure is empty: added + duplicate + invalid == non-blank lines.
// When failure is set, the batch stopped at the failing entry and the counts describe the
// entries committed before it.
struct AddReport {
  std::size_t added{0};
  std::size_t duplicate{0};
  std::size_t invalid{0};
  std::vector<InvalidEntry> invalid_entries;
  std::optional<StoreFailure> failure;

  // Entries that reached the store (new + already present).
  [[nodiscard]] std::size_t processed() const { return added + duplicate; }
};

// RemoveReport summarises a batch remove. Absent targets are counted, never errors.
struct RemoveReport {
  std::size_t removed{0};
  std::size_t not_found{0};
  std::vector<std::string> not_found_domains;
  std::optional<StoreFailure> failure;

  [[nodiscard]] std::size_t processed() const { return removed + not_found; }
};

struct DeleteReport {
  bool existed{false};
  std::int64_t deleted_entries{0};
};

// ExportArtifact is a rendered point-in-time snapshot of a collection.
struct ExportArtifact {
  std::size_t domain_count{0};
  std::string content;
};

enum class ExportFormat {
  kText,
  kJson,
};

// parse_export_format accepts "text" and "json" (case-insensitive).
[[nodiscard]] std::optional<ExportFormat> parse_export_format(const std::string& name);

}  // namespace krazedb::store
