#include "redis_health.h"

#include "krazedb/storage/redis_config.h"
#include "krazedb/storage/redis_health.h"

#include "cli_config.h"
#include "cli_usage.h"
#include "startup_guard.h"
#include <iostream>
#include <string>

int cmd_redis_health(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const auto options = krazedb::cli::common_options();
  const auto parsed = krazedb::apps::parse_options(argc, argv, options);
  if (parsed.config.help) {
    print_command_usage(std::cout, "health", "Check that Redis is reachable", options);
    return 0;
  }
  if (!report_parse_errors(parsed.errors, std::cerr)) {
    return 1;
  }

  const auto resolved =
      krazedb::cli::resolve_app_config(parsed.config, krazedb::config::process_env);
  if (!resolved.has_value()) {
    std::cerr << resolved.error() << "\n";
    return 1;
  }
  for (const auto& warning : resolved.value().warnings) {
    std::cerr << "Warning: " << warning << "\n";
  }

  const auto& config = resolved.value().config;
  const std::string config_error = krazedb::cli::validate_app_config(config);
  if (!config_error.empty()) {
    std::cerr << config_error << "\n";
    return 1;
  }

  const auto result = krazedb::storage::redis_ping(config.redis);
  if (result.reachable) {
    std::cout << "OK: Redis reachable at "
              << krazedb::storage::redis_config_to_log_string(config.redis) << "\n";
    return 0;
  }

  std::cerr << "ERROR: " << result.error << "\n";
  return 1;
}
