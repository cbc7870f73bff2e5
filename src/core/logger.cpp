#include "krazedb/core/logger.h"

#include "krazedb/core/normalization.h"

namespace krazedb::core {

std::optional<LogLevel> parse_log_level(const std::string_view name) {
  const std::string lowered = normalize_ascii_lower(trim(name));
  if (lowered == "debug") {
    return LogLevel::kDebug;
  }
  if (lowered == "info") {
    return LogLevel::kInfo;
  }
  if (lowered == "warning" || lowered == "warn") {
    return LogLevel::kWarning;
  }
  if (lowered == "error") {
    return LogLevel::kError;
  }
  return std::nullopt;
}

std::string log_level_name(const LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "DEBUG";
    case LogLevel::kInfo:
      return "INFO";
    case LogLevel::kWarning:
      return "WARNING";
    case LogLevel::kError:
      return "ERROR";
  }
  return "INFO";
}

void Logger::log(const LogLevel level, const std::string_view message) {
  if (!enabled(level) || sinks_.empty()) {
    return;
  }

  const std::string line =
      clock_.now_iso8601() + " - krazedb - " + log_level_name(level) + " - " + std::string{message};
  for (std::ostream* sink : sinks_) {
    *sink << line << '\n';
    sink->flush();
  }
}

}  // namespace krazedb::core
