#include "config.h"

#include <charconv>
#include <utility>
#include <system_error>

namespace snotes::server {

namespace {

// ────────────────────────────────────────────────────────────────
// Option Handlers
// ────────────────────────────────────────────────────────────────

std::string handle_storage(ServerConfig& config, const std::string& value) {
  auto backend = storage::parse_storage_backend(value);
  if (!backend.has_value()) {
    return "Invalid --storage: " + value + " (valid: memory, sqlite)";
  }
  config.storage = backend.value();
  return "";
}

std::string handle_db(ServerConfig& config, const std::string& value) {
  config.db_path = value;
  return "";
}

std::string handle_worker_id(ServerConfig& config, const std::string& value) {
  int parsed = 0;
  const auto* first = value.data();
  const auto* last = value.data() + value.size();
  const auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (ec != std::errc{} || ptr != last) {
    return "Invalid --worker-id: " + value + " (expected an integer)";
  }
  config.worker_id = parsed;
  return "";
}

std::string handle_sweep_on_start(ServerConfig& config, const std::string& /*value*/) {
  config.sweep_on_start = true;
  return "";
}

std::string handle_help(ServerConfig& config, const std::string& /*value*/) {
  config.show_help = true;
  return "";
}

}  // namespace

// ────────────────────────────────────────────────────────────────
// Option Registry
// ────────────────────────────────────────────────────────────────

const std::vector<apps::Option<ServerConfig>>& server_options() {
  static const std::vector<apps::Option<ServerConfig>> options = {
      {"--storage", true, "Paste storage backend (memory|sqlite)", handle_storage},
      {"--db", true, "Path to SQLite database file (implies --storage sqlite)", handle_db},
      {"--worker-id", true, "Snowflake worker id, unique per running instance (0-1023)",
       handle_worker_id},
      {"--sweep-on-start", false, "Delete expired pastes once before serving",
       handle_sweep_on_start},
      {"--help", false, "Print this help and exit", handle_help},
  };
  return options;
}

// ────────────────────────────────────────────────────────────────
// Parser
// ────────────────────────────────────────────────────────────────

ServerConfig parse_args(int argc, char* argv[]) {
  auto parsed = apps::parse_options(argc, argv, server_options());

  ServerConfig config = std::move(parsed.config);
  for (auto& error : parsed.errors) {
    config.errors.push_back(std::move(error));
  }
  for (const auto& positional : parsed.positionals) {
    config.errors.push_back("Unexpected argument: " + positional);
  }
  return config;
}

storage::StorageBackend effective_backend(const ServerConfig& config) {
  if (config.storage.has_value()) {
    return config.storage.value();
  }
  return config.db_path.has_value() ? storage::StorageBackend::kSqlite
                                    : storage::StorageBackend::kMemory;
}

storage::StorageOptions to_storage_options(const ServerConfig& config) {
  storage::StorageOptions options;
  options.backend = effective_backend(config);
  options.db_path = config.db_path;
  options.worker_id = config.worker_id;
  return options;
}

}  // namespace snotes::server
