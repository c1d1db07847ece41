#include "snotes/core/clock.h"
#include "snotes/core/errors.h"
#include "snotes/core/sha256.h"
#include "snotes/domain/paste.h"
#include "snotes/storage/sqlite/sqlite_db.h"
#include "snotes/storage/sqlite/sqlite_paste_storage.h"
#include "snotes/token/base62.h"
#include "snotes/token/token_generator.h"

#include <catch2/catch.hpp>

#include <chrono>
#include <filesystem>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

using namespace snotes;
using namespace std::chrono_literals;
using storage::sqlite::SqliteDb;
using storage::sqlite::SqlitePasteStorage;

// 2026-01-01T00:00:00Z
static const core::Timestamp kStart = core::from_unix_millis(1767225600000);
static const std::string kText{domain::kDefaultContentType};

// Helper: open an in-memory DB with schema v1 applied.
static std::shared_ptr<SqliteDb> make_db(const std::string& path = ":memory:") {
  auto result = SqliteDb::open(path);
  REQUIRE(result.has_value());
  auto db = result.value();
  auto schema = db->ensure_schema_v1();
  REQUIRE(schema.has_value());
  return db;
}

static std::unique_ptr<SqlitePasteStorage> make_storage(std::shared_ptr<SqliteDb> db,
                                                        core::IClock& clock, int worker_id = 1) {
  return std::make_unique<SqlitePasteStorage>(
      std::move(db), std::make_unique<token::SnowflakeTokenGenerator>(worker_id, clock), clock);
}

class RepeatingTokenGenerator final : public token::ITokenGenerator {
 public:
  token::GeneratedToken next() override {
    return token::GeneratedToken{core::PasteToken{token::encode_base62(42)}, 42};
  }
};

// ── schema ──────────────────────────────────────────────────────────────────

TEST_CASE("SqliteDb::ensure_schema_v1 is idempotent", "[storage][sqlite][schema]") {
  auto db = make_db();
  CHECK(db->get_schema_version() == 1);

  auto again = db->ensure_schema_v1();
  REQUIRE(again.has_value());
  CHECK(db->get_schema_version() == 1);
}

TEST_CASE("SqliteDb::open reports an unreachable path", "[storage][sqlite][errors]") {
  auto result = SqliteDb::open("/nonexistent-dir/for/snotes/test.db");
  CHECK_FALSE(result.has_value());
}

// ── create / get ────────────────────────────────────────────────────────────

TEST_CASE("SqlitePasteStorage::create fills derived fields", "[storage][sqlite]") {
  core::SystemClock clock;
  auto store = make_storage(make_db(), clock);

  const auto before = core::now_utc();
  const auto paste = store->create("Hello, World!", 3600, kText);

  CHECK(token::is_well_formed_token(paste.token.value));
  CHECK(paste.size_bytes == 13);
  CHECK(paste.sha256 == core::sha256_hex("Hello, World!"));
  CHECK(paste.expires_at - paste.created_at == std::chrono::seconds{3600});

  const auto until_expiry = paste.expires_at - before;
  CHECK(until_expiry >= std::chrono::seconds{3590});
  CHECK(until_expiry <= std::chrono::seconds{3610});
}

TEST_CASE("SqlitePasteStorage::get returns the record create returned", "[storage][sqlite]") {
  core::ManualClock clock(kStart);
  auto store = make_storage(make_db(), clock);

  const std::string content = "\xe6\x97\xa5\xe6\x9c\xac";
  const auto created = store->create(content, 600, "text/markdown");
  CHECK(created.size_bytes == 6);

  clock.advance(5s);
  const auto fetched = store->get(created.token);
  REQUIRE(fetched.has_value());
  CHECK(fetched.value() == created);
}

TEST_CASE("SqlitePasteStorage preserves embedded NUL bytes", "[storage][sqlite]") {
  core::ManualClock clock(kStart);
  auto store = make_storage(make_db(), clock);

  const std::string content("a\0b", 3);
  const auto created = store->create(content, 60, kText);

  const auto fetched = store->get(created.token);
  REQUIRE(fetched.has_value());
  CHECK(fetched->content == content);
  CHECK(fetched->size_bytes == 3);
}

TEST_CASE("SqlitePasteStorage::get returns nullopt for an unknown token", "[storage][sqlite]") {
  core::ManualClock clock(kStart);
  auto store = make_storage(make_db(), clock);

  CHECK_FALSE(store->get(core::PasteToken{"00000000000"}).has_value());
}

TEST_CASE("SqlitePasteStorage::create raises TokenCollisionError on a repeated token",
          "[storage][sqlite][errors]") {
  core::ManualClock clock(kStart);
  SqlitePasteStorage store(make_db(), std::make_unique<RepeatingTokenGenerator>(), clock);

  (void)store.create("first", 60, kText);
  CHECK_THROWS_AS(store.create("second", 60, kText), core::TokenCollisionError);
  CHECK(store.row_count() == 1);
}

TEST_CASE("SqlitePasteStorage requires a database and a generator", "[storage][sqlite][errors]") {
  core::ManualClock clock(kStart);
  CHECK_THROWS_AS(
      SqlitePasteStorage(nullptr, std::make_unique<RepeatingTokenGenerator>(), clock),
      std::invalid_argument);
  CHECK_THROWS_AS(SqlitePasteStorage(make_db(), nullptr, clock), std::invalid_argument);
}

TEST_CASE("SqlitePasteStorage surfaces SQLite failures as PersistenceFailureError",
          "[storage][sqlite][errors]") {
  core::ManualClock clock(kStart);
  auto db = make_db();
  auto store = make_storage(db, clock);

  auto dropped = db->exec("DROP TABLE pastes");
  REQUIRE(dropped.has_value());

  try {
    (void)store->create("orphan", 60, kText);
    FAIL("expected PersistenceFailureError");
  } catch (const core::PersistenceFailureError& e) {
    CHECK(e.kind() == core::ErrorKind::kPersistenceFailure);
  }
  CHECK_THROWS_AS(store->get(core::PasteToken{"00000000000"}), core::PersistenceFailureError);
  CHECK_THROWS_AS(store->cleanup_expired(), core::PersistenceFailureError);
}

// ── expiry ──────────────────────────────────────────────────────────────────

TEST_CASE("SqlitePasteStorage::get hides an expired row without deleting it",
          "[storage][sqlite][expiry]") {
  core::ManualClock clock(kStart);
  auto store = make_storage(make_db(), clock);

  const auto paste = store->create("short lived", 60, kText);

  clock.advance(59999ms);
  CHECK(store->get(paste.token).has_value());

  clock.advance(1ms);  // now == expires_at
  CHECK_FALSE(store->get(paste.token).has_value());
  CHECK(store->row_count() == 1);

  // The row is still on disk, so the sweep counts it.
  CHECK(store->cleanup_expired() == 1);
  CHECK(store->row_count() == 0);
  CHECK(store->cleanup_expired() == 0);
}

TEST_CASE("SqlitePasteStorage::cleanup_expired removes only expired rows",
          "[storage][sqlite][expiry]") {
  core::ManualClock clock(kStart);
  auto store = make_storage(make_db(), clock);

  std::vector<core::PasteToken> lasting;
  for (int i = 0; i < 4; ++i) {
    (void)store->create("expiring " + std::to_string(i), 60, kText);
  }
  for (int i = 0; i < 3; ++i) {
    lasting.push_back(store->create("lasting " + std::to_string(i), 3600, kText).token);
  }

  clock.advance(2min);
  CHECK(store->cleanup_expired() == 4);
  CHECK(store->row_count() == 3);
  for (const auto& token : lasting) {
    CHECK(store->get(token).has_value());
  }
}

// ── durability ──────────────────────────────────────────────────────────────

TEST_CASE("SqlitePasteStorage pastes survive reopening the database file",
          "[storage][sqlite][durability]") {
  const auto path = std::filesystem::temp_directory_path() / "snotes_test_durability.db";
  std::filesystem::remove(path);

  core::ManualClock clock(kStart);
  domain::StoredPaste created;
  {
    auto store = make_storage(make_db(path.string()), clock, 3);
    created = store->create("durable", 3600, kText);
  }

  clock.advance(1s);
  {
    auto store = make_storage(make_db(path.string()), clock, 3);
    const auto fetched = store->get(created.token);
    REQUIRE(fetched.has_value());
    CHECK(fetched.value() == created);

    // A restarted worker keeps minting distinct tokens from the wall clock.
    const auto next = store->create("after restart", 3600, kText);
    CHECK(next.token != created.token);
  }

  std::filesystem::remove(path);
}

TEST_CASE("SqlitePasteStorage instances sharing a database see each other's pastes",
          "[storage][sqlite]") {
  core::ManualClock clock(kStart);
  auto db = make_db();
  auto writer = make_storage(db, clock, 1);
  auto reader = make_storage(db, clock, 2);

  const auto created = writer->create("shared", 60, kText);
  const auto fetched = reader->get(created.token);
  REQUIRE(fetched.has_value());
  CHECK(fetched->content == "shared");
}
