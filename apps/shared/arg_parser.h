#pragma once

#include <functional>
#include <ostream>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace krazedb::apps {

// Option describes a single command-line flag accepted by a subcommand.
// Config is the caller-defined configuration struct that handlers populate.
//
// names lists every spelling of the flag ("-f", "--file"); the last one is shown in usage.
// handler returns true on success, false on validation failure. The failing flag is recorded
// in ParsedOptions::errors and parsing continues with the remaining flags.
template <typename Config>
struct Option {
  std::vector<std::string> names;  // NOLINT(readability-identifier-naming)
  bool requires_value{false};      // NOLINT(readability-identifier-naming)
  std::string description;         // NOLINT(readability-identifier-naming)
  std::function<bool(Config&, const std::string& value)>
      handler;  // NOLINT(readability-identifier-naming)
};

template <typename Config>
struct ParsedOptions {
  Config config;                    // NOLINT(readability-identifier-naming)
  std::vector<std::string> errors;  // NOLINT(readability-identifier-naming)

  [[nodiscard]] bool ok() const { return errors.empty(); }
};

// parse_options iterates argv[start..argc-1], dispatches each recognised flag to its
// handler, and returns the populated config together with every problem found.
// Unknown flags, missing values and rejected values are all reported in errors.
// Non-flag tokens are errors too: every subcommand takes its inputs through flags.
template <typename Config>
ParsedOptions<Config> parse_options(int argc, char* argv[],  // NOLINT(modernize-avoid-c-arrays)
                                    const std::vector<Option<Config>>& options, int start = 2,
                                    Config default_config = {}) {
  ParsedOptions<Config> parsed{std::move(default_config), {}};

  std::unordered_map<std::string, const Option<Config>*> option_map;
  for (const auto& opt : options) {
    for (const auto& name : opt.names) {
      option_map[name] = &opt;
    }
  }

  for (int i = start; i < argc; ++i) {
    std::string arg = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

    auto it = option_map.find(arg);
    if (it == option_map.end()) {
      if (!arg.empty() && arg[0] == '-') {
        parsed.errors.push_back("Unknown option: " + arg);
      } else {
        parsed.errors.push_back("Unexpected argument: " + arg);
      }
      continue;
    }

    const Option<Config>* opt = it->second;
    std::string value;
    if (opt->requires_value) {
      if (i + 1 >= argc) {
        parsed.errors.push_back("Option " + arg + " requires a value");
        continue;
      }
      value = argv[++i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    }

    if (!opt->handler(parsed.config, value)) {
      parsed.errors.push_back("Invalid value for " + arg + ": " + value);
    }
  }

  return parsed;
}

// print_option_usage writes one aligned line per option.
template <typename Config>
void print_option_usage(std::ostream& out, const std::vector<Option<Config>>& options) {
  for (const auto& opt : options) {
    std::string flags;
    for (const auto& name : opt.names) {
      if (!flags.empty()) {
        flags += ", ";
      }
      flags += name;
    }
    if (opt.requires_value) {
      flags += " <value>";
    }
    out << "  " << flags;
    if (flags.size() < 26) {
      out << std::string(26 - flags.size(), ' ');
    } else {
      out << "  ";
    }
    out << opt.description << "\n";
  }
}

}  // namespace krazedb::apps
