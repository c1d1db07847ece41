#pragma once

// StorageBackend: authoritative vocabulary for the --storage flag.
//
// CLI flag: --storage <value>
// Valid runtime values: "memory", "sqlite"

#include "snotes/core/clock.h"
#include "snotes/storage/paste_storage.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace snotes::storage {

enum class StorageBackend : uint8_t {
  kMemory,  // "memory": InMemoryPasteStorage (ephemeral, default)
  kSqlite,  // "sqlite": SqlitePasteStorage  (persistent, requires a database path)
};

// parse_storage_backend parses a --storage flag value.
// Returns std::nullopt for unrecognised values (including empty string). Case-sensitive.
[[nodiscard]] inline std::optional<StorageBackend> parse_storage_backend(const std::string& s) {
  if (s == "memory") {
    return StorageBackend::kMemory;
  }
  if (s == "sqlite") {
    return StorageBackend::kSqlite;
  }
  return std::nullopt;
}

[[nodiscard]] inline std::string_view to_string(StorageBackend b) {
  switch (b) {
    case StorageBackend::kMemory:
      return "memory";
    case StorageBackend::kSqlite:
      return "sqlite";
  }
  return "unknown";  // unreachable, all enumerators covered above
}

struct StorageOptions {
  StorageBackend backend{StorageBackend::kMemory};  // NOLINT(readability-identifier-naming)
  std::optional<std::string> db_path;  // required for kSqlite; ":memory:" allowed
  int worker_id{0};                    // Snowflake worker id, [0, 1023]
};

// create_paste_storage builds the configured backend together with the
// SnowflakeTokenGenerator it owns. For kSqlite the database is opened and schema v1
// applied.
//
// Throws:
// - std::invalid_argument: kSqlite without db_path
// - core::InvalidWorkerIdError: worker_id out of range
// - core::PersistenceFailureError: database open or schema failure
[[nodiscard]] std::unique_ptr<IPasteStorage> create_paste_storage(const StorageOptions& options,
                                                                  core::IClock& clock);

}  // namespace snotes::storage
