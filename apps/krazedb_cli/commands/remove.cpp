#include "remove.h"

#include "krazedb/io/domain_file.h"

#include "cli_config.h"
#include "cli_usage.h"
#include "remove_logic.h"
#include "store_session.h"
#include <iostream>
#include <string>
#include <vector>

using krazedb::cli::CliConfig;

int cmd_remove(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const auto options = krazedb::cli::with_common_options({
      {{"-f", "--file"}, true, "File containing domains to remove",
       [](CliConfig& c, const std::string& v) {
         c.file = v;
         return true;
       }},
      {{"-d", "--domain"}, true, "Single domain to remove",
       [](CliConfig& c, const std::string& v) {
         c.domain = v;
         return true;
       }},
  });
  const auto parsed = krazedb::apps::parse_options(argc, argv, options);
  if (parsed.config.help) {
    print_command_usage(std::cout, "remove", "Remove domains from a collection", options);
    return 0;
  }
  if (!report_parse_errors(parsed.errors, std::cerr)) {
    return 1;
  }

  const CliConfig& config = parsed.config;
  if (config.file.has_value() == config.domain.has_value()) {
    std::cerr << "Error: exactly one of --file <path> or --domain <name> is required\n";
    return 1;
  }

  std::vector<std::string> targets;
  if (config.file.has_value()) {
    auto lines = krazedb::io::read_domain_lines(config.file.value());
    if (!lines.has_value()) {
      std::cerr << "Error: " << lines.error() << "\n";
      return 1;
    }
    targets = lines.value();
  } else {
    targets.push_back(config.domain.value());
  }

  auto session = krazedb::cli::StoreSession::open(config);
  if (!session) {
    return 1;
  }

  return execute_remove(targets, session->store(), std::cout, std::cerr);
}
