#include "startup_guard.h"

#include "snotes/token/snowflake_generator.h"

namespace snotes::server {

std::string validate_server_config(const ServerConfig& config) {
  if (!config.errors.empty()) {
    return "Error: " + config.errors.front() + "\n       Run with --help for usage.";
  }

  // Reject here rather than letting the generator throw after startup output.
  if (config.worker_id < 0 || config.worker_id > token::SnowflakeGenerator::kMaxWorkerId) {
    return "Error: --worker-id " + std::to_string(config.worker_id) +
           " is out of range.\n"
           "       Worker ids must be between 0 and 1023 and unique among running instances.";
  }

  switch (effective_backend(config)) {
    case storage::StorageBackend::kSqlite:
      if (!config.db_path.has_value() || config.db_path->empty()) {
        return "Error: --db <path> is required when --storage sqlite";
      }
      break;
    case storage::StorageBackend::kMemory:
      if (config.db_path.has_value()) {
        return "Error: --db is only valid with --storage sqlite";
      }
      break;
  }

  return "";
}

}  // namespace snotes::server
