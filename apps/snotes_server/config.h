#pragma once

#include "snotes/storage/storage_backend.h"

#include "shared/arg_parser.h"
#include <optional>
#include <string>
#include <vector>

namespace snotes::server {

// ServerConfig holds all parsed startup flags for the paste server.
// Every field has an explicit default; optional fields mean "not configured".
struct ServerConfig {
  std::optional<snotes::storage::StorageBackend> storage;  // unset: --db implies sqlite
  std::optional<std::string> db_path;              // NOLINT(readability-identifier-naming)
  int worker_id{0};                                // NOLINT(readability-identifier-naming)
  bool sweep_on_start{false};                      // NOLINT(readability-identifier-naming)
  bool show_help{false};                           // NOLINT(readability-identifier-naming)
  std::vector<std::string> errors;                 // rejected flags, reported by the guard
};

// Option registry for the server binary (also used to print --help).
[[nodiscard]] const std::vector<apps::Option<ServerConfig>>& server_options();

ServerConfig parse_args(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

// effective_backend resolves the implicit default: --db alone selects sqlite.
[[nodiscard]] storage::StorageBackend effective_backend(const ServerConfig& config);

// to_storage_options maps validated flags onto the storage factory's options.
[[nodiscard]] storage::StorageOptions to_storage_options(const ServerConfig& config);

}  // namespace snotes::server
