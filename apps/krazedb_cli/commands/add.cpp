#include "add.h"

#include "krazedb/io/domain_file.h"

#include "add_logic.h"
#include "cli_config.h"
#include "cli_usage.h"
#include "store_session.h"
#include <iostream>
#include <string>
#include <vector>

using krazedb::cli::CliConfig;

int cmd_add(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const auto options = krazedb::cli::with_common_options({
      {{"-f", "--file"}, true, "File containing domains, one per line",
       [](CliConfig& c, const std::string& v) {
         c.file = v;
         return true;
       }},
      {{"--no-validate"}, false, "Skip domain validation",
       [](CliConfig& c, const std::string&) {
         c.no_validate = true;
         return true;
       }},
  });
  const auto parsed = krazedb::apps::parse_options(argc, argv, options);
  if (parsed.config.help) {
    print_command_usage(std::cout, "add", "Add domains from a file", options);
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

  // A missing input file is fatal before any connection is attempted.
  const auto lines = krazedb::io::read_domain_lines(config.file.value());
  if (!lines.has_value()) {
    std::cerr << "Error: " << lines.error() << "\n";
    return 1;
  }

  auto session = krazedb::cli::StoreSession::open(config);
  if (!session) {
    return 1;
  }

  return execute_add(lines.value(), !config.no_validate, session->store(), std::cout, std::cerr);
}
