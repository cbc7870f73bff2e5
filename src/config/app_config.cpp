#include "krazedb/config/app_config.h"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace krazedb::config {

namespace {

void read_int(const nlohmann::json& section, const char* key, int& target,
              const std::string& section_name, std::vector<std::string>& warnings) {
  if (!section.contains(key)) {
    return;
  }
  const auto& value = section.at(key);
  if (!value.is_number_integer()) {
    warnings.push_back("Config key " + section_name + "." + key + " must be an integer");
    return;
  }
  target = value.get<int>();
}

void read_string(const nlohmann::json& section, const char* key, std::string& target,
                 const std::string& section_name, std::vector<std::string>& warnings) {
  if (!section.contains(key)) {
    return;
  }
  const auto& value = section.at(key);
  if (!value.is_string()) {
    warnings.push_back("Config key " + section_name + "." + key + " must be a string");
    return;
  }
  target = value.get<std::string>();
}

void merge_json(const nlohmann::json& doc, ConfigLoad& load) {
  if (!doc.is_object()) {
    load.warnings.emplace_back("Config root must be a JSON object");
    return;
  }

  if (doc.contains("redis")) {
    const auto& redis = doc.at("redis");
    if (redis.is_object()) {
      auto& target = load.config.redis;
      read_string(redis, "host", target.host, "redis", load.warnings);
      read_int(redis, "port", target.port, "redis", load.warnings);
      read_int(redis, "db", target.db, "redis", load.warnings);
      read_int(redis, "max_connections", target.max_connections, "redis", load.warnings);
      read_int(redis, "socket_timeout_ms", target.socket_timeout_ms, "redis", load.warnings);
    } else {
      load.warnings.emplace_back("Config section redis must be an object");
    }
  }

  if (doc.contains("logging")) {
    const auto& logging = doc.at("logging");
    if (logging.is_object()) {
      read_string(logging, "level", load.config.logging.level, "logging", load.warnings);
      std::string file;
      read_string(logging, "file", file, "logging", load.warnings);
      if (!file.empty()) {
        load.config.logging.file = file;
      }
    } else {
      load.warnings.emplace_back("Config section logging must be an object");
    }
  }
}

std::optional<int> parse_env_int(const std::string& text) {
  if (text.empty() || text.size() > 9) {
    return std::nullopt;
  }
  int value = 0;
  for (const char c : text) {
    if (c < '0' || c > '9') {
      return std::nullopt;
    }
    value = value * 10 + (c - '0');
  }
  return value;
}

}  // namespace

ConfigLoad load_config_json(const std::string& json_text) {
  ConfigLoad load;
  const auto doc = nlohmann::json::parse(json_text, nullptr, false);
  if (doc.is_discarded()) {
    load.warnings.emplace_back("Config is not valid JSON; using defaults");
    return load;
  }
  merge_json(doc, load);
  return load;
}

ConfigLoad load_config_file(const std::optional<std::string>& path) {
  if (!path.has_value()) {
    return ConfigLoad{};
  }

  std::error_code ec;
  if (!std::filesystem::exists(path.value(), ec)) {
    return ConfigLoad{};
  }

  std::ifstream in(path.value());
  if (!in) {
    ConfigLoad load;
    load.warnings.push_back("Failed to read config file " + path.value() + "; using defaults");
    return load;
  }

  std::ostringstream buffer;
  buffer << in.rdbuf();
  ConfigLoad load = load_config_json(buffer.str());
  for (auto& warning : load.warnings) {
    warning = path.value() + ": " + warning;
  }
  return load;
}

std::optional<std::string> process_env(const std::string& name) {
  const char* value = std::getenv(name.c_str());
  if (value == nullptr) {
    return std::nullopt;
  }
  return std::string(value);
}

void apply_env_overrides(ConfigLoad& load, const EnvLookup& env) {
  if (const auto host = env("REDIS_HOST"); host.has_value() && !host->empty()) {
    load.config.redis.host = host.value();
  }

  if (const auto port = env("REDIS_PORT"); port.has_value() && !port->empty()) {
    if (const auto parsed = parse_env_int(port.value())) {
      load.config.redis.port = parsed.value();
    } else {
      load.warnings.push_back("Invalid REDIS_PORT value: " + port.value());
    }
  }

  if (const auto db = env("REDIS_DB"); db.has_value() && !db->empty()) {
    if (const auto parsed = parse_env_int(db.value())) {
      load.config.redis.db = parsed.value();
    } else {
      load.warnings.push_back("Invalid REDIS_DB value: " + db.value());
    }
  }
}

}  // namespace krazedb::config
