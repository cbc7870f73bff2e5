#include "krazedb/core/version.h"

#include "commands/add.h"
#include "commands/delete_all.h"
#include "commands/export.h"
#include "commands/query.h"
#include "commands/redis_health.h"
#include "commands/remove.h"
#include <exception>
#include <functional>
#include <iostream>
#include <map>
#include <string>

namespace {

using CommandFn = std::function<int(int, char**)>;

struct Command {
  CommandFn run;
  std::string summary;
};

const std::map<std::string, Command>& command_table() {
  static const std::map<std::string, Command> kCommands = {
      {"add", {cmd_add, "Add domains from file"}},
      {"remove", {cmd_remove, "Remove domains from database"}},
      {"export", {cmd_export, "Export domains to file"}},
      {"print", {cmd_print, "Print all domains"}},
      {"count", {cmd_count, "Count domains in database"}},
      {"projects", {cmd_projects, "List project collections"}},
      {"delete-all", {cmd_delete_all, "Delete all domains"}},
      {"delete", {cmd_delete_all, "Alias for delete-all"}},
      {"health", {cmd_redis_health, "Check Redis connectivity"}},
  };
  return kCommands;
}

void print_usage(std::ostream& out) {
  out << "krazedb v" << krazedb::core::kBuildVersion << " - manage bug bounty targets\n\n"
      << "Usage: krazedb <command> [options]\n\nCommands:\n";
  for (const auto& [name, command] : command_table()) {
    out << "  " << name << std::string(name.size() < 12 ? 12 - name.size() : 1, ' ')
        << command.summary << "\n";
  }
  out << "\nExamples:\n"
         "  krazedb add -f domains.txt\n"
         "  krazedb export -f output.json --format json\n"
         "  krazedb count --project acme\n"
         "  krazedb remove -d example.com\n"
         "  krazedb delete-all --confirm\n\n"
         "Run 'krazedb <command> --help' for command options.\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    print_usage(std::cout);
    return 0;
  }

  const std::string subcommand = argv[1];
  if (subcommand == "-h" || subcommand == "--help" || subcommand == "help") {
    print_usage(std::cout);
    return 0;
  }
  if (subcommand == "--version") {
    std::cout << "krazedb " << krazedb::core::kBuildVersion << "\n";
    return 0;
  }

  const auto& commands = command_table();
  const auto it = commands.find(subcommand);
  if (it == commands.end()) {
    std::cerr << "Unknown command: " << subcommand << "\n\n";
    print_usage(std::cerr);
    return 1;
  }

  try {
    return it->second.run(argc, argv);
  } catch (const std::exception& e) {
    std::cerr << "Unexpected error: " << e.what() << "\n";
    return 1;
  }
}
