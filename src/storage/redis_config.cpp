#include "krazedb/storage/redis_config.h"

#include <string>
#include <string_view>

namespace krazedb::storage {

namespace {

// Parses a non-empty run of decimal digits. Rejects signs, spaces and overflow.
std::optional<int> parse_decimal(const std::string_view text) {
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

std::optional<RedisConfig> parse_redis_uri(const std::string& uri) {
  if (uri.empty()) {
    return std::nullopt;
  }

  std::string_view view{uri};
  std::string_view host_port_view;
  bool allows_db = false;

  if (view.starts_with("tcp://")) {
    host_port_view = view.substr(6);
  } else if (view.starts_with("redis://")) {
    host_port_view = view.substr(8);
    allows_db = true;
  } else {
    return std::nullopt;
  }

  RedisConfig config;

  const auto slash_pos = host_port_view.find('/');
  if (slash_pos != std::string_view::npos) {
    if (!allows_db) {
      return std::nullopt;
    }
    const auto db = parse_decimal(host_port_view.substr(slash_pos + 1));
    if (!db.has_value()) {
      return std::nullopt;
    }
    config.db = db.value();
    host_port_view = host_port_view.substr(0, slash_pos);
  }

  if (host_port_view.empty()) {
    return std::nullopt;
  }

  // Split on last colon to separate host from port.
  const auto colon_pos = host_port_view.rfind(':');
  if (colon_pos == std::string_view::npos) {
    config.host = std::string{host_port_view};
  } else {
    config.host = std::string{host_port_view.substr(0, colon_pos)};
    const auto port = parse_decimal(host_port_view.substr(colon_pos + 1));
    if (!port.has_value() || port.value() < 1 || port.value() > 65535) {
      return std::nullopt;
    }
    config.port = port.value();
  }

  if (config.host.empty()) {
    return std::nullopt;
  }

  return config;
}

std::string redis_config_to_log_string(const RedisConfig& config) {
  std::string out = config.host + ":" + std::to_string(config.port);
  if (config.db != 0) {
    out += "/" + std::to_string(config.db);
  }
  return out;
}

}  // namespace krazedb::storage
