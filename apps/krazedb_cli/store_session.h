#pragma once

#include "krazedb/config/app_config.h"
#include "krazedb/core/clock.h"
#include "krazedb/core/logger.h"
#include "krazedb/storage/set_storage.h"
#include "krazedb/store/domain_store.h"

#include "cli_config.h"
#include <fstream>
#include <memory>

namespace krazedb::cli {

// StoreSession owns everything one CLI invocation needs to reach its collection:
// clock, logger (stderr + optional log file), the pooled Redis storage and the DomainStore.
// Created once per process and released when main returns.
class StoreSession {
 public:
  // open resolves and validates configuration, sets up logging and connects to Redis.
  // On failure it prints the reason to stderr and returns nullptr.
  [[nodiscard]] static std::unique_ptr<StoreSession> open(const CliConfig& cli);

  ~StoreSession();

  StoreSession(const StoreSession&) = delete;
  StoreSession& operator=(const StoreSession&) = delete;
  StoreSession(StoreSession&&) = delete;
  StoreSession& operator=(StoreSession&&) = delete;

  [[nodiscard]] core::Logger& logger() { return logger_; }
  [[nodiscard]] storage::ISetStorage& storage() { return *storage_; }
  [[nodiscard]] store::DomainStore& store() { return *store_; }

 private:
  explicit StoreSession(core::LogLevel level);

  core::SystemClock clock_;
  std::ofstream log_file_;
  core::Logger logger_;
  std::unique_ptr<storage::ISetStorage> storage_;
  std::unique_ptr<store::DomainStore> store_;
};

// attach_log_file opens logging.file in append mode when one is configured.
// Returns false only if a file was configured and could not be opened.
bool attach_log_file(std::ofstream& file, const config::LoggingConfig& logging);

}  // namespace krazedb::cli
