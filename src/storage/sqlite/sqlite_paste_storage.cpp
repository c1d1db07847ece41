#include "snotes/storage/sqlite/sqlite_paste_storage.h"

#include "snotes/core/errors.h"

#include <sqlite3.h>

#include <chrono>
#include <stdexcept>
#include <utility>

namespace snotes::storage::sqlite {

namespace {

// Column order shared by every SELECT below:
//   0: token, 1: content, 2: content_type, 3: size_bytes, 4: sha256,
//   5: created_at_ms, 6: expires_at_ms
constexpr const char* kSelectLive =
    "SELECT token, content, content_type, size_bytes, sha256, created_at_ms, expires_at_ms "
    "FROM pastes WHERE token = ? AND expires_at_ms > ?";

constexpr const char* kInsert = R"(
  INSERT INTO pastes
    (token, snowflake_id, content, content_type, size_bytes, sha256, created_at_ms, expires_at_ms)
  VALUES (?, ?, ?, ?, ?, ?, ?, ?)
)";

constexpr const char* kDeleteExpired = "DELETE FROM pastes WHERE expires_at_ms <= ?";

std::string column_string(sqlite3_stmt* stmt, const int col) {
  const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
  if (text == nullptr) {
    return {};
  }
  return std::string(text, static_cast<std::size_t>(sqlite3_column_bytes(stmt, col)));
}

bool is_uniqueness_violation(const int extended_code) {
  return extended_code == SQLITE_CONSTRAINT_PRIMARYKEY ||
         extended_code == SQLITE_CONSTRAINT_UNIQUE;
}

}  // namespace

SqlitePasteStorage::SqlitePasteStorage(std::shared_ptr<SqliteDb> db,
                                       std::unique_ptr<token::ITokenGenerator> tokens,
                                       core::IClock& clock)
    : db_(std::move(db)), tokens_(std::move(tokens)), clock_(clock) {
  if (!db_ || !tokens_) {
    throw std::invalid_argument("SqlitePasteStorage requires a database and a token generator");
  }
}

domain::StoredPaste SqlitePasteStorage::create(const std::string& content,
                                               const std::int64_t ttl_seconds,
                                               const std::string& content_type) {
  auto minted = tokens_->next();
  const std::uint64_t snowflake_id = minted.numeric_id;
  auto paste = domain::make_stored_paste(std::move(minted.token), content, content_type,
                                         clock_.now(), std::chrono::seconds{ttl_seconds});

  std::lock_guard<std::mutex> lock(mutex_);

  PreparedStatement stmt(db_->connection(), kInsert);
  if (!stmt.is_valid()) {
    throw core::PersistenceFailureError("SqlitePasteStorage::create failed to prepare: " +
                                        stmt.error());
  }

  sqlite3_bind_text(stmt.get(), 1, paste.token.value.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int64(stmt.get(), 2, static_cast<sqlite3_int64>(snowflake_id));
  sqlite3_bind_text(stmt.get(), 3, paste.content.data(), static_cast<int>(paste.content.size()),
                    SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 4, paste.content_type.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int64(stmt.get(), 5, static_cast<sqlite3_int64>(paste.size_bytes));
  sqlite3_bind_text(stmt.get(), 6, paste.sha256.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int64(stmt.get(), 7, core::to_unix_millis(paste.created_at));
  sqlite3_bind_int64(stmt.get(), 8, core::to_unix_millis(paste.expires_at));

  const int rc = sqlite3_step(stmt.get());
  if (rc != SQLITE_DONE) {
    if (is_uniqueness_violation(sqlite3_extended_errcode(db_->connection()))) {
      throw core::TokenCollisionError(paste.token.value);
    }
    throw core::PersistenceFailureError("SqlitePasteStorage::create failed: " +
                                        db_->last_error());
  }

  return paste;
}

std::optional<domain::StoredPaste> SqlitePasteStorage::get(const core::PasteToken& token) {
  const auto now = clock_.now();

  std::lock_guard<std::mutex> lock(mutex_);

  PreparedStatement stmt(db_->connection(), kSelectLive);
  if (!stmt.is_valid()) {
    throw core::PersistenceFailureError("SqlitePasteStorage::get failed to prepare: " +
                                        stmt.error());
  }

  sqlite3_bind_text(stmt.get(), 1, token.value.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int64(stmt.get(), 2, core::to_unix_millis(now));

  const int rc = sqlite3_step(stmt.get());
  if (rc == SQLITE_ROW) {
    return row_to_paste(stmt.get());
  }
  if (rc != SQLITE_DONE) {
    throw core::PersistenceFailureError("SqlitePasteStorage::get failed: " + db_->last_error());
  }
  return std::nullopt;
}

std::size_t SqlitePasteStorage::cleanup_expired() {
  const auto now = clock_.now();

  std::lock_guard<std::mutex> lock(mutex_);

  PreparedStatement stmt(db_->connection(), kDeleteExpired);
  if (!stmt.is_valid()) {
    throw core::PersistenceFailureError("SqlitePasteStorage::cleanup_expired failed to prepare: " +
                                        stmt.error());
  }

  sqlite3_bind_int64(stmt.get(), 1, core::to_unix_millis(now));

  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    throw core::PersistenceFailureError("SqlitePasteStorage::cleanup_expired failed: " +
                                        db_->last_error());
  }

  return static_cast<std::size_t>(sqlite3_changes(db_->connection()));
}

std::size_t SqlitePasteStorage::row_count() const {
  std::lock_guard<std::mutex> lock(mutex_);

  PreparedStatement stmt(db_->connection(), "SELECT COUNT(*) FROM pastes");
  if (!stmt.is_valid()) {
    throw core::PersistenceFailureError("SqlitePasteStorage::row_count failed to prepare: " +
                                        stmt.error());
  }
  if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
    throw core::PersistenceFailureError("SqlitePasteStorage::row_count failed: " +
                                        db_->last_error());
  }
  return static_cast<std::size_t>(sqlite3_column_int64(stmt.get(), 0));
}

domain::StoredPaste SqlitePasteStorage::row_to_paste(sqlite3_stmt* stmt) const {
  domain::StoredPaste paste;
  paste.token = core::PasteToken{column_string(stmt, 0)};
  paste.content = column_string(stmt, 1);
  paste.content_type = column_string(stmt, 2);
  paste.size_bytes = static_cast<std::size_t>(sqlite3_column_int64(stmt, 3));
  paste.sha256 = column_string(stmt, 4);
  paste.created_at = core::from_unix_millis(sqlite3_column_int64(stmt, 5));
  paste.expires_at = core::from_unix_millis(sqlite3_column_int64(stmt, 6));
  return paste;
}

}  // namespace snotes::storage::sqlite
