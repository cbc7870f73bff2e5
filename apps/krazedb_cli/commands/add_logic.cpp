#include "add_logic.h"

#include <iomanip>
#include <sstream>

std::string format_add_summary(const krazedb::store::AddReport& report) {
  const std::size_t total = report.processed();
  const double duplicate_pct =
      total > 0 ? static_cast<double>(report.duplicate) * 100.0 / static_cast<double>(total)
                : 0.0;

  std::ostringstream oss;
  oss << "Processed " << total << " domains: " << report.added << " new, " << report.duplicate
      << " duplicates (" << std::fixed << std::setprecision(2) << duplicate_pct << "%)";
  return oss.str();
}

int execute_add(const std::vector<std::string>& lines, const bool validate,
                krazedb::store::DomainStore& store, std::ostream& out, std::ostream& err) {
  const auto report = store.add(lines, krazedb::store::AddOptions{validate});

  out << format_add_summary(report) << "\n";
  if (report.invalid > 0) {
    out << "Skipped " << report.invalid << " invalid domains\n";
    for (const auto& entry : report.invalid_entries) {
      out << "  line " << entry.line_number << ": " << entry.line << " ("
          << krazedb::validation::invalid_reason_name(entry.reason) << ")\n";
    }
  }

  if (report.failure.has_value()) {
    err << "Error: add aborted: " << report.failure->message << "\n";
    return 1;
  }
  return 0;
}
