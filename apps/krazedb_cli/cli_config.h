#pragma once

#include "krazedb/config/app_config.h"
#include "krazedb/core/result.h"
#include "krazedb/store/store_reports.h"

#include "shared/arg_parser.h"
#include <optional>
#include <string>
#include <vector>

namespace krazedb::cli {

// CliConfig holds every flag any subcommand accepts.
// Each subcommand registers the common flags plus its own.
struct CliConfig {
  std::optional<std::string> config_path;  // NOLINT(readability-identifier-naming)
  bool verbose{false};                     // NOLINT(readability-identifier-naming)
  std::optional<std::string> project;      // NOLINT(readability-identifier-naming)
  std::optional<std::string> redis_uri;    // NOLINT(readability-identifier-naming)
  bool help{false};                        // NOLINT(readability-identifier-naming)

  std::optional<std::string> file;    // NOLINT(readability-identifier-naming)
  std::optional<std::string> domain;  // NOLINT(readability-identifier-naming)
  store::ExportFormat format{         // NOLINT(readability-identifier-naming)
                             store::ExportFormat::kText};
  bool no_validate{false};  // NOLINT(readability-identifier-naming)
  bool confirm{false};      // NOLINT(readability-identifier-naming)
};

using CliOption = apps::Option<CliConfig>;

// common_options: -c/--config, -v/--verbose, -p/--project, --redis, -h/--help.
[[nodiscard]] std::vector<CliOption> common_options();

// with_common_options appends the common flags to a subcommand's own flags.
[[nodiscard]] std::vector<CliOption> with_common_options(std::vector<CliOption> own);

// resolve_app_config layers defaults, the JSON config file, environment overrides and the
// --redis / --verbose flags, in that order.
// Error: --redis was given but is not a valid Redis URI.
[[nodiscard]] core::Result<config::ConfigLoad, std::string> resolve_app_config(
    const CliConfig& cli, const config::EnvLookup& env);

}  // namespace krazedb::cli
