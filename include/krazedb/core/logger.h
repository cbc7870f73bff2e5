#pragma once

#include "krazedb/core/clock.h"

#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace krazedb::core {

enum class LogLevel {
  kDebug,
  kInfo,
  kWarning,
  kError,
};

// parse_log_level maps "DEBUG" / "INFO" / "WARNING" / "ERROR" (case-insensitive) to a level.
// "WARN" is accepted as an alias for WARNING.
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view name);

[[nodiscard]] std::string log_level_name(LogLevel level);

// Logger writes one line per message to every attached sink:
//   "<iso8601> - krazedb - <LEVEL> - <message>"
// Messages below the threshold are dropped. Sinks are borrowed; the caller keeps them alive
// for the lifetime of the Logger.
class Logger {
 public:
  Logger(LogLevel threshold, IClock& clock) : threshold_(threshold), clock_(clock) {}

  void add_sink(std::ostream& sink) { sinks_.push_back(&sink); }

  void set_threshold(LogLevel threshold) { threshold_ = threshold; }
  [[nodiscard]] LogLevel threshold() const { return threshold_; }
  [[nodiscard]] bool enabled(LogLevel level) const { return level >= threshold_; }

  void log(LogLevel level, std::string_view message);

  void debug(std::string_view message) { log(LogLevel::kDebug, message); }
  void info(std::string_view message) { log(LogLevel::kInfo, message); }
  void warning(std::string_view message) { log(LogLevel::kWarning, message); }
  void error(std::string_view message) { log(LogLevel::kError, message); }

 private:
  LogLevel threshold_;
  IClock& clock_;
  std::vector<std::ostream*> sinks_;
};

}  // namespace krazedb::core
