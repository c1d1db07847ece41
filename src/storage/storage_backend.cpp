#include "snotes/storage/storage_backend.h"

#include "snotes/core/errors.h"
#include "snotes/storage/inmemory_paste_storage.h"
#include "snotes/storage/sqlite/sqlite_db.h"
#include "snotes/storage/sqlite/sqlite_paste_storage.h"
#include "snotes/token/token_generator.h"

#include <stdexcept>
#include <utility>

namespace snotes::storage {

std::unique_ptr<IPasteStorage> create_paste_storage(const StorageOptions& options,
                                                    core::IClock& clock) {
  // Validate the worker id before touching the database.
  auto tokens = std::make_unique<token::SnowflakeTokenGenerator>(options.worker_id, clock);

  switch (options.backend) {
    case StorageBackend::kMemory:
      return std::make_unique<InMemoryPasteStorage>(std::move(tokens), clock);

    case StorageBackend::kSqlite: {
      if (!options.db_path.has_value()) {
        throw std::invalid_argument("sqlite storage requires a database path");
      }

      auto db_result = sqlite::SqliteDb::open(options.db_path.value());
      if (!db_result.has_value()) {
        throw core::PersistenceFailureError(db_result.error());
      }

      auto db = db_result.value();
      auto schema_result = db->ensure_schema_v1();
      if (!schema_result.has_value()) {
        throw core::PersistenceFailureError(schema_result.error());
      }

      return std::make_unique<sqlite::SqlitePasteStorage>(std::move(db), std::move(tokens), clock);
    }
  }

  throw std::invalid_argument("unknown storage backend");
}

}  // namespace snotes::storage
