#pragma once

#include "krazedb/config/app_config.h"

#include <optional>
#include <string>

namespace krazedb::cli {

// validate_app_config checks the resolved configuration before any connection is made.
//
// Returns: "" on success, non-empty error message on failure.
// Caller is responsible for printing the error and exiting with code 1.
//
// Preconditions checked (first failure is returned):
// - redis.host is non-empty
// - redis.port in 1..65535
// - redis.db >= 0
// - redis.max_connections >= 1
// - redis.socket_timeout_ms >= 1
// - logging.level is one of DEBUG, INFO, WARNING, ERROR
[[nodiscard]] std::string validate_app_config(const config::AppConfig& config);

// validate_project_name accepts an absent project or a name of [A-Za-z0-9._-]+.
// The name becomes part of a storage key, so separators and glob characters are refused.
[[nodiscard]] std::string validate_project_name(const std::optional<std::string>& project);

}  // namespace krazedb::cli
