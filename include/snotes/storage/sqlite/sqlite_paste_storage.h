#pragma once

#include "snotes/core/clock.h"
#include "snotes/storage/paste_storage.h"
#include "snotes/storage/sqlite/sqlite_db.h"
#include "snotes/token/token_generator.h"

#include <memory>
#include <mutex>

namespace snotes::storage::sqlite {

// SqlitePasteStorage implements IPasteStorage on the `pastes` table (schema v1).
//
// Expiry: every read carries `expires_at_ms > now`, so an expired row is invisible to get()
// without being deleted. Expired rows stay on disk until cleanup_expired() removes them,
// which therefore counts a row even if a get() already reported it absent.
//
// Errors: any SQLite failure throws core::PersistenceFailureError with the SQLite message.
// A PRIMARY KEY or UNIQUE(snowflake_id) violation on insert throws
// core::TokenCollisionError instead.
//
// Thread-safety: statement execution on the shared connection is serialised by a mutex so
// that sqlite3_changes()/sqlite3_errmsg() describe the statement just run.
class SqlitePasteStorage final : public IPasteStorage {
 public:
  // db must already have schema v1 applied. clock must outlive the storage.
  SqlitePasteStorage(std::shared_ptr<SqliteDb> db, std::unique_ptr<token::ITokenGenerator> tokens,
                     core::IClock& clock);
  ~SqlitePasteStorage() override = default;

  SqlitePasteStorage(const SqlitePasteStorage&) = delete;
  SqlitePasteStorage& operator=(const SqlitePasteStorage&) = delete;
  SqlitePasteStorage(SqlitePasteStorage&&) = delete;
  SqlitePasteStorage& operator=(SqlitePasteStorage&&) = delete;

  domain::StoredPaste create(const std::string& content, std::int64_t ttl_seconds,
                             const std::string& content_type) override;
  [[nodiscard]] std::optional<domain::StoredPaste> get(const core::PasteToken& token) override;
  std::size_t cleanup_expired() override;
  [[nodiscard]] std::string_view backend_name() const override { return "sqlite"; }

  // Physical row count, including expired rows not yet swept.
  [[nodiscard]] std::size_t row_count() const;

 private:
  std::shared_ptr<SqliteDb> db_;
  std::unique_ptr<token::ITokenGenerator> tokens_;
  core::IClock& clock_;
  mutable std::mutex mutex_;

  // Helper to deserialize a paste from a SELECT row (column order in the .cpp)
  [[nodiscard]] domain::StoredPaste row_to_paste(sqlite3_stmt* stmt) const;
};

}  // namespace snotes::storage::sqlite
