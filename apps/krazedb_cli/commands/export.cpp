#include "export.h"

#include "cli_config.h"
#include "cli_usage.h"
#include "export_logic.h"
#include "store_session.h"
#include <iostream>
#include <string>

using krazedb::cli::CliConfig;

int cmd_export(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const auto options = krazedb::cli::with_common_options({
      {{"-f", "--file"}, true, "Output file",
       [](CliConfig& c, const std::string& v) {
         c.file = v;
         return true;
       }},
      {{"--format"}, true, "Export format (text|json)",
       [](CliConfig& c, const std::string& v) {
         const auto format = krazedb::store::parse_export_format(v);
         if (!format.has_value()) {
           return false;
         }
         c.format = format.value();
         return true;
       }},
  });
  const auto parsed = krazedb::apps::parse_options(argc, argv, options);
  if (parsed.config.help) {
    print_command_usage(std::cout, "export", "Export domains to a file", options);
    return 0;
  }
  if (!report_parse_errors(parsed.errors, std::cerr)) {
    return 1;
  }

  const CliConfig& config = parsed.config;
  if (!config.file.has_value()) {
    std::cerr << "Error: --file <path> is required\n";
    return 1;
  }

  auto session = krazedb::cli::StoreSession::open(config);
  if (!session) {
    return 1;
  }

  return execute_export(config.file.value(), config.format, session->store(), std::cout,
                        std::cerr);
}
