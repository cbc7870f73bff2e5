#include "remove_logic.h"

int execute_remove(const std::vector<std::string>& targets, krazedb::store::DomainStore& store,
                   std::ostream& out, std::ostream& err) {
  const auto report = store.remove(targets);

  out << "Processed " << report.processed() << " domains: " << report.removed << " removed, "
      << report.not_found << " not found\n";
  for (const auto& domain : report.not_found_domains) {
    out << "  not found: " << domain << "\n";
  }

  if (report.failure.has_value()) {
    err << "Error: remove aborted: " << report.failure->message << "\n";
    return 1;
  }
  return 0;
}
