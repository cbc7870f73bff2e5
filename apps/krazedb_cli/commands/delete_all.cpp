#include "delete_all.h"

#include "cli_config.h"
#include "cli_usage.h"
#include "delete_all_logic.h"
#include "store_session.h"
#include <iostream>
#include <string>

using krazedb::cli::CliConfig;

int cmd_delete_all(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const auto options = krazedb::cli::with_common_options({
      {{"--confirm"}, false, "Skip confirmation prompt",
       [](CliConfig& c, const std::string&) {
         c.confirm = true;
         return true;
       }},
  });
  const auto parsed = krazedb::apps::parse_options(argc, argv, options);
  if (parsed.config.help) {
    print_command_usage(std::cout, "delete-all", "Delete all domains in a collection", options);
    return 0;
  }
  if (!report_parse_errors(parsed.errors, std::cerr)) {
    return 1;
  }

  auto session = krazedb::cli::StoreSession::open(parsed.config);
  if (!session) {
    return 1;
  }

  return execute_delete_all(parsed.config.confirm, session->store(), std::cin, std::cout,
                            std::cerr);
}
