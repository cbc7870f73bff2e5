#include "cli_config.h"

#include "krazedb/storage/redis_config.h"

#include <utility>

namespace krazedb::cli {

std::vector<CliOption> common_options() {
  return {
      {{"-c", "--config"}, true, "Configuration file path (JSON)",
       [](CliConfig& c, const std::string& v) {
         c.config_path = v;
         return true;
       }},
      {{"-v", "--verbose"}, false, "Enable debug logging",
       [](CliConfig& c, const std::string&) {
         c.verbose = true;
         return true;
       }},
      {{"-p", "--project"}, true, "Project collection to operate on (default: global)",
       [](CliConfig& c, const std::string& v) {
         c.project = v;
         return true;
       }},
      {{"--redis"}, true, "Redis URI, overrides config (e.g. redis://127.0.0.1:6379/0)",
       [](CliConfig& c, const std::string& v) {
         c.redis_uri = v;
         return true;
       }},
      {{"-h", "--help"}, false, "Show help for this command",
       [](CliConfig& c, const std::string&) {
         c.help = true;
         return true;
       }},
  };
}

std::vector<CliOption> with_common_options(std::vector<CliOption> own) {
  auto common = common_options();
  own.insert(own.end(), std::make_move_iterator(common.begin()),
             std::make_move_iterator(common.end()));
  return own;
}

core::Result<config::ConfigLoad, std::string> resolve_app_config(const CliConfig& cli,
                                                                 const config::EnvLookup& env) {
  using R = core::Result<config::ConfigLoad, std::string>;

  config::ConfigLoad load = config::load_config_file(cli.config_path);
  config::apply_env_overrides(load, env);

  if (cli.redis_uri.has_value()) {
    const auto parsed = storage::parse_redis_uri(cli.redis_uri.value());
    if (!parsed.has_value()) {
      return R::err("Error: --redis URI '" + cli.redis_uri.value() +
                    "' is not a valid Redis URI.\n"
                    "       Accepted formats: tcp://host:port, redis://host:port/N, tcp://host");
    }
    load.config.redis.host = parsed->host;
    load.config.redis.port = parsed->port;
    load.config.redis.db = parsed->db;
  }

  if (cli.verbose) {
    load.config.logging.level = "DEBUG";
  }

  return R::ok(std::move(load));
}

}  // namespace krazedb::cli
