#pragma once

#include "cli_config.h"
#include <ostream>
#include <string>
#include <vector>

// print_command_usage writes "Usage: krazedb <command> [options]" and the option table.
inline void print_command_usage(std::ostream& out, const std::string& command,
                                const std::string& summary,
                                const std::vector<krazedb::cli::CliOption>& options) {
  out << "Usage: krazedb " << command << " [options]\n\n" << summary << "\n\nOptions:\n";
  krazedb::apps::print_option_usage(out, options);
}

// report_parse_errors prints every flag problem; returns true when there were none.
inline bool report_parse_errors(const std::vector<std::string>& errors, std::ostream& err) {
  for (const auto& error : errors) {
    err << "Error: " << error << "\n";
  }
  return errors.empty();
}
