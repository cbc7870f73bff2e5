#include "krazedb/store/domain_store.h"

#include "krazedb/core/normalization.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <utility>

namespace krazedb::store {

namespace {

StoreFailure to_failure(const storage::SetStorageError& e) {
  const StoreErrorKind kind = e.kind() == core::StorageError::kUnavailable
                                  ? StoreErrorKind::kConnection
                                  : StoreErrorKind::kBackend;
  return StoreFailure{kind, e.what()};
}

std::vector<std::string> sorted_unique(std::vector<std::string> values) {
  std::sort(values.begin(), values.end());
  values.erase(std::unique(values.begin(), values.end()), values.end());
  return values;
}

}  // namespace

std::optional<ExportFormat> parse_export_format(const std::string& name) {
  const std::string lowered = core::normalize_ascii_lower(core::trim(name));
  if (lowered == "text") {
    return ExportFormat::kText;
  }
  if (lowered == "json") {
    return ExportFormat::kJson;
  }
  return std::nullopt;
}

DomainStore::DomainStore(storage::ISetStorage& storage, CollectionKey collection,
                         core::Logger& logger, core::IClock& clock)
    : storage_(storage),
      collection_(std::move(collection)),
      key_(collection_.storage_key()),
      logger_(logger),
      clock_(clock) {}

AddReport DomainStore::add(const std::vector<std::string>& lines, const AddOptions& options) {
  AddReport report;

  for (std::size_t i = 0; i < lines.size(); ++i) {
    const std::size_t line_number = i + 1;
    std::string entry;

    if (options.validate) {
      const auto result = validation::classify(lines[i]);
      if (result.status == validation::ValidationStatus::kSkipped) {
        continue;
      }
      if (result.status == validation::ValidationStatus::kInvalid) {
        const std::string text = core::trim(lines[i]);
        const auto reason = result.reason.value_or(validation::InvalidReason::kInvalidLabel);
        logger_.warning("Invalid domain '" + text + "' on line " + std::to_string(line_number) +
                        " (" + validation::invalid_reason_name(reason) + "), skipping");
        ++report.invalid;
        report.invalid_entries.push_back(InvalidEntry{line_number, text, reason});
        continue;
      }
      entry = result.domain;
    } else {
      entry = core::normalize_entry(lines[i]);
      if (entry.empty()) {
        continue;
      }
    }

    try {
      if (storage_.add_member(key_, entry)) {
        ++report.added;
      } else {
        ++report.duplicate;
        logger_.debug("Duplicate domain '" + entry + "' on line " + std::to_string(line_number));
      }
    } catch (const storage::SetStorageError& e) {
      logger_.error("Failed to add domain '" + entry + "': " + e.what());
      report.failure = to_failure(e);
      return report;
    }
  }

  return report;
}

RemoveReport DomainStore::remove(const std::vector<std::string>& lines) {
  RemoveReport report;

  for (const auto& line : lines) {
    const std::string target = core::normalize_entry(line);
    if (target.empty()) {
      continue;
    }

    try {
      if (storage_.remove_member(key_, target)) {
        ++report.removed;
        logger_.debug("Removed domain '" + target + "'");
      } else {
        ++report.not_found;
        report.not_found_domains.push_back(target);
        logger_.warning("Domain '" + target + "' not found in " + collection_.display_name() +
                        " collection");
      }
    } catch (const storage::SetStorageError& e) {
      logger_.error("Failed to remove domain '" + target + "': " + e.what());
      report.failure = to_failure(e);
      return report;
    }
  }

  return report;
}

core::Result<std::int64_t, StoreFailure> DomainStore::count() {
  try {
    return core::Result<std::int64_t, StoreFailure>::ok(storage_.cardinality(key_));
  } catch (const storage::SetStorageError& e) {
    logger_.error(std::string("Failed to count domains: ") + e.what());
    return core::Result<std::int64_t, StoreFailure>::err(to_failure(e));
  }
}

core::Result<std::vector<std::string>, StoreFailure> DomainStore::list() {
  try {
    auto members = storage_.members(key_);
    std::sort(members.begin(), members.end());
    return core::Result<std::vector<std::string>, StoreFailure>::ok(std::move(members));
  } catch (const storage::SetStorageError& e) {
    logger_.error(std::string("Failed to get domains: ") + e.what());
    return core::Result<std::vector<std::string>, StoreFailure>::err(to_failure(e));
  }
}

core::Result<ExportArtifact, StoreFailure> DomainStore::export_snapshot(
    const ExportFormat format) {
  auto listed = list();
  if (!listed.has_value()) {
    return core::Result<ExportArtifact, StoreFailure>::err(listed.error());
  }

  const auto& domains = listed.value();
  ExportArtifact artifact;
  artifact.domain_count = domains.size();
  artifact.content = format == ExportFormat::kJson
                         ? render_json_export(domains, clock_.now_iso8601())
                         : render_text_export(domains);
  return core::Result<ExportArtifact, StoreFailure>::ok(std::move(artifact));
}

core::Result<DeleteReport, StoreFailure> DomainStore::delete_collection(
    const DeleteConfirmation confirmation) {
  if (confirmation != DeleteConfirmation::kConfirmed) {
    return core::Result<DeleteReport, StoreFailure>::err(
        StoreFailure{StoreErrorKind::kConfirmationRequired,
                     "Deleting the " + collection_.display_name() +
                         " collection requires confirmation"});
  }

  try {
    logger_.info("Attempting to delete all domains in " + collection_.display_name() +
                 " collection");
    DeleteReport report;
    report.deleted_entries = storage_.cardinality(key_);
    report.existed = storage_.delete_key(key_);
    if (!report.existed) {
      report.deleted_entries = 0;
    }
    return core::Result<DeleteReport, StoreFailure>::ok(report);
  } catch (const storage::SetStorageError& e) {
    logger_.error(std::string("Failed to delete all domains: ") + e.what());
    return core::Result<DeleteReport, StoreFailure>::err(to_failure(e));
  }
}

core::Result<std::vector<std::string>, StoreFailure> list_projects(storage::ISetStorage& storage) {
  try {
    const std::string prefix{kProjectKeyPrefix};
    std::vector<std::string> names;
    for (const auto& key : storage.list_keys(prefix + "*")) {
      if (key.size() > prefix.size() && key.compare(0, prefix.size(), prefix) == 0) {
        names.push_back(key.substr(prefix.size()));
      }
    }
    // SCAN may report a key more than once.
    return core::Result<std::vector<std::string>, StoreFailure>::ok(sorted_unique(std::move(names)));
  } catch (const storage::SetStorageError& e) {
    return core::Result<std::vector<std::string>, StoreFailure>::err(to_failure(e));
  }
}

std::string render_json_export(const std::vector<std::string>& sorted_domains,
                               const std::string& exported_at) {
  nlohmann::json doc;
  doc["domain_count"] = sorted_domains.size();
  doc["exported_at"] = exported_at;
  doc["domains"] = sorted_domains;
  return doc.dump(2) + "\n";
}

std::string render_text_export(const std::vector<std::string>& sorted_domains) {
  std::string out;
  for (const auto& domain : sorted_domains) {
    out += domain;
    out += '\n';
  }
  return out;
}

}  // namespace krazedb::store
