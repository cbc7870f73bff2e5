#include "store_session.h"

#include "krazedb/storage/redis_config.h"
#include "krazedb/storage/redis_set_storage.h"

#include "startup_guard.h"
#include <iostream>
#include <stdexcept>

namespace krazedb::cli {

bool attach_log_file(std::ofstream& file, const config::LoggingConfig& logging) {
  if (!logging.file.has_value()) {
    return true;
  }
  file.open(logging.file.value(), std::ios::out | std::ios::app);
  return file.is_open();
}

StoreSession::StoreSession(const core::LogLevel level) : logger_(level, clock_) {
  logger_.add_sink(std::cerr);
}

StoreSession::~StoreSession() = default;

std::unique_ptr<StoreSession> StoreSession::open(const CliConfig& cli) {
  // Validate flags and config before emitting any log output so no partial messages appear.
  const std::string project_error = validate_project_name(cli.project);
  if (!project_error.empty()) {
    std::cerr << project_error << "\n";
    return nullptr;
  }

  const auto resolved = resolve_app_config(cli, config::process_env);
  if (!resolved.has_value()) {
    std::cerr << resolved.error() << "\n";
    return nullptr;
  }
  const config::ConfigLoad& load = resolved.value();

  const std::string config_error = validate_app_config(load.config);
  if (!config_error.empty()) {
    std::cerr << config_error << "\n";
    return nullptr;
  }

  // Level was validated above.
  const core::LogLevel level = core::parse_log_level(load.config.logging.level).value();
  std::unique_ptr<StoreSession> session(new StoreSession(level));

  if (!attach_log_file(session->log_file_, load.config.logging)) {
    session->logger_.warning("Failed to open log file " + load.config.logging.file.value() +
                             "; logging to stderr only");
  } else if (session->log_file_.is_open()) {
    session->logger_.add_sink(session->log_file_);
  }

  for (const auto& warning : load.warnings) {
    session->logger_.warning(warning);
  }

  const std::string target = storage::redis_config_to_log_string(load.config.redis);
  try {
    session->storage_ = std::make_unique<storage::RedisSetStorage>(load.config.redis);
  } catch (const std::runtime_error& e) {
    session->logger_.error(e.what());
    session->logger_.error(
        "Failed to connect to Redis. Please check your Redis server is running.");
    return nullptr;
  }
  session->logger_.info("Connected to Redis at " + target + " (pool size " +
                        std::to_string(load.config.redis.max_connections) + ")");

  session->store_ = std::make_unique<store::DomainStore>(
      *session->storage_, store::CollectionKey::from_project_option(cli.project),
      session->logger_, session->clock_);
  session->logger_.debug("Using " + session->store_->collection().display_name() +
                         " collection (key " + session->store_->collection().storage_key() + ")");

  return session;
}

}  // namespace krazedb::cli
