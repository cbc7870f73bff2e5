#include "query.h"

#include "cli_config.h"
#include "cli_usage.h"
#include "query_logic.h"
#include "store_session.h"
#include <iostream>
#include <memory>
#include <string>

namespace {

// Parses the common flags and opens a session. On nullptr the caller returns status.
std::unique_ptr<krazedb::cli::StoreSession> open_for_query(
    int argc, char* argv[],  // NOLINT(modernize-avoid-c-arrays)
    const std::string& command, const std::string& summary, int& status) {
  const auto options = krazedb::cli::common_options();
  const auto parsed = krazedb::apps::parse_options(argc, argv, options);
  if (parsed.config.help) {
    print_command_usage(std::cout, command, summary, options);
    status = 0;
    return nullptr;
  }
  if (!report_parse_errors(parsed.errors, std::cerr)) {
    status = 1;
    return nullptr;
  }

  auto session = krazedb::cli::StoreSession::open(parsed.config);
  status = session ? 0 : 1;
  return session;
}

}  // namespace

int cmd_print(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  int status = 0;
  auto session = open_for_query(argc, argv, "print", "Print all domains", status);
  if (!session) {
    return status;
  }
  return execute_print(session->store(), std::cout, std::cerr);
}

int cmd_count(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  int status = 0;
  auto session = open_for_query(argc, argv, "count", "Count domains in a collection", status);
  if (!session) {
    return status;
  }
  return execute_count(session->store(), std::cout, std::cerr);
}

int cmd_projects(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  int status = 0;
  auto session = open_for_query(argc, argv, "projects", "List project collections", status);
  if (!session) {
    return status;
  }
  return execute_projects(session->storage(), std::cout, std::cerr);
}
