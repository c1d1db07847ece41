#include "snotes/core/clock.h"
#include "snotes/core/errors.h"
#include "snotes/token/snowflake_generator.h"

#include <catch2/catch.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace snotes;
using token::SnowflakeGenerator;

// 2026-01-01T00:00:00Z
static constexpr std::int64_t kStartMillis = 1767225600000;

static core::Timestamp at(std::int64_t unix_millis) {
  return core::from_unix_millis(unix_millis);
}

// Replays a fixed list of readings, then keeps returning the last one.
class ScriptedClock final : public core::IClock {
 public:
  explicit ScriptedClock(std::vector<std::int64_t> readings) : readings_(std::move(readings)) {}

  core::Timestamp now() override {
    const std::size_t i = next_ < readings_.size() ? next_++ : readings_.size() - 1;
    return at(readings_[i]);
  }

 private:
  std::vector<std::int64_t> readings_;
  std::size_t next_{0};
};

// ── Construction ────────────────────────────────────────────────────────────

TEST_CASE("SnowflakeGenerator accepts worker ids 0 and 1023", "[snowflake]") {
  core::ManualClock clock(at(kStartMillis));

  SnowflakeGenerator low(0, clock);
  SnowflakeGenerator high(1023, clock);

  CHECK(low.worker_id() == 0);
  CHECK(high.worker_id() == 1023);
  CHECK(SnowflakeGenerator::decompose(high.generate()).worker_id == 1023);
}

TEST_CASE("SnowflakeGenerator rejects worker ids outside 0..1023", "[snowflake][errors]") {
  core::ManualClock clock(at(kStartMillis));

  CHECK_THROWS_AS(SnowflakeGenerator(-1, clock), core::InvalidWorkerIdError);
  CHECK_THROWS_AS(SnowflakeGenerator(1024, clock), core::InvalidWorkerIdError);

  try {
    SnowflakeGenerator bad(1024, clock);
    FAIL("expected InvalidWorkerIdError");
  } catch (const core::InvalidWorkerIdError& e) {
    CHECK(e.kind() == core::ErrorKind::kInvalidWorkerId);
    CHECK(e.worker_id() == 1024);
    CHECK(std::string(e.what()).find("worker_id must be between 0 and 1023") !=
          std::string::npos);
  }
}

// ── Layout ──────────────────────────────────────────────────────────────────

TEST_CASE("generate packs timestamp, worker id and sequence", "[snowflake]") {
  core::ManualClock clock(at(kStartMillis));
  SnowflakeGenerator gen(42, clock);

  const auto first = SnowflakeGenerator::decompose(gen.generate());
  const auto second = SnowflakeGenerator::decompose(gen.generate());

  CHECK(first.timestamp_ms == kStartMillis - SnowflakeGenerator::kEpochUnixMillis);
  CHECK(first.worker_id == 42);
  CHECK(first.sequence == 0);
  CHECK(second.timestamp_ms == first.timestamp_ms);
  CHECK(second.sequence == 1);
}

TEST_CASE("generate leaves the top bit clear", "[snowflake]") {
  core::SystemClock clock;
  SnowflakeGenerator gen(1023, clock);

  const std::uint64_t id = gen.generate();
  CHECK((id >> 63) == 0);
}

TEST_CASE("sequence resets when the millisecond advances", "[snowflake]") {
  core::ManualClock clock(at(kStartMillis));
  SnowflakeGenerator gen(1, clock);

  (void)gen.generate();
  (void)gen.generate();
  clock.advance(std::chrono::milliseconds{1});

  const auto parts = SnowflakeGenerator::decompose(gen.generate());
  CHECK(parts.sequence == 0);
  CHECK(parts.timestamp_ms == kStartMillis - SnowflakeGenerator::kEpochUnixMillis + 1);
}

// ── Monotonicity and uniqueness ─────────────────────────────────────────────

TEST_CASE("generate is strictly increasing on a live clock", "[snowflake]") {
  core::SystemClock clock;
  SnowflakeGenerator gen(7, clock);

  std::set<std::uint64_t> seen;
  std::uint64_t previous = gen.generate();
  seen.insert(previous);
  for (int i = 0; i < 5000; ++i) {
    const std::uint64_t id = gen.generate();
    REQUIRE(id > previous);
    seen.insert(id);
    previous = id;
  }
  CHECK(seen.size() == 5001);
}

TEST_CASE("generate is strictly increasing across threads", "[snowflake][concurrency]") {
  core::SystemClock clock;
  SnowflakeGenerator gen(3, clock);

  constexpr int kThreads = 4;
  constexpr int kPerThread = 2000;

  std::mutex collected_mutex;
  std::vector<std::uint64_t> collected;
  bool each_thread_increasing = true;

  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&] {
      std::vector<std::uint64_t> local;
      local.reserve(kPerThread);
      for (int i = 0; i < kPerThread; ++i) {
        local.push_back(gen.generate());
      }
      std::lock_guard<std::mutex> lock(collected_mutex);
      for (std::size_t i = 1; i < local.size(); ++i) {
        if (local[i] <= local[i - 1]) {
          each_thread_increasing = false;
        }
      }
      collected.insert(collected.end(), local.begin(), local.end());
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  CHECK(each_thread_increasing);
  const std::set<std::uint64_t> distinct(collected.begin(), collected.end());
  CHECK(distinct.size() == static_cast<std::size_t>(kThreads * kPerThread));
}

// ── Sequence exhaustion ─────────────────────────────────────────────────────

TEST_CASE("4097th id in one millisecond waits for the next millisecond", "[snowflake]") {
  // 4096 readings for the first 4096 ids, one more for the 4097th call that exhausts the
  // sequence, then the poll sees the next millisecond.
  std::vector<std::int64_t> readings(4097, kStartMillis);
  readings.push_back(kStartMillis + 1);
  ScriptedClock clock(readings);
  SnowflakeGenerator gen(5, clock);

  std::uint64_t previous = 0;
  for (int i = 0; i < 4096; ++i) {
    const std::uint64_t id = gen.generate();
    REQUIRE(id > previous);
    previous = id;
  }
  const auto last_in_ms = SnowflakeGenerator::decompose(previous);
  CHECK(last_in_ms.sequence == 4095);

  const std::uint64_t next = gen.generate();
  const auto parts = SnowflakeGenerator::decompose(next);
  CHECK(next > previous);
  CHECK(parts.timestamp_ms == last_in_ms.timestamp_ms + 1);
  CHECK(parts.sequence == 0);
}

TEST_CASE("clock regression during the exhaustion wait leaves state unchanged",
          "[snowflake][errors]") {
  std::vector<std::int64_t> readings(4097, kStartMillis);
  readings.push_back(kStartMillis - 3);  // poll sees the clock step back
  readings.push_back(kStartMillis + 1);  // recovered
  ScriptedClock clock(readings);
  SnowflakeGenerator gen(5, clock);

  std::uint64_t previous = 0;
  for (int i = 0; i < 4096; ++i) {
    previous = gen.generate();
  }

  CHECK_THROWS_AS(gen.generate(), core::ClockRegressionError);

  const std::uint64_t recovered = gen.generate();
  CHECK(recovered > previous);
  CHECK(SnowflakeGenerator::decompose(recovered).sequence == 0);
}

// ── Clock faults ────────────────────────────────────────────────────────────

TEST_CASE("backwards clock raises ClockRegressionError without issuing an id",
          "[snowflake][errors]") {
  core::ManualClock clock(at(kStartMillis));
  SnowflakeGenerator gen(9, clock);

  const std::uint64_t before = gen.generate();

  clock.set(at(kStartMillis - 5));
  try {
    (void)gen.generate();
    FAIL("expected ClockRegressionError");
  } catch (const core::ClockRegressionError& e) {
    CHECK(e.kind() == core::ErrorKind::kClockRegression);
    CHECK(e.now_millis() < e.last_millis());
  }

  // Same millisecond as the last id is not a regression.
  clock.set(at(kStartMillis));
  const std::uint64_t same_ms = gen.generate();
  CHECK(same_ms > before);

  clock.set(at(kStartMillis + 10));
  CHECK(gen.generate() > same_ms);
}

TEST_CASE("clock before the epoch raises ClockOutOfRangeError", "[snowflake][errors]") {
  core::ManualClock clock(at(SnowflakeGenerator::kEpochUnixMillis - 1));
  SnowflakeGenerator gen(0, clock);

  CHECK_THROWS_AS(gen.generate(), core::ClockOutOfRangeError);

  clock.set(at(SnowflakeGenerator::kEpochUnixMillis));
  CHECK(SnowflakeGenerator::decompose(gen.generate()).timestamp_ms == 0);
}

TEST_CASE("clock beyond the 41-bit range raises ClockOutOfRangeError", "[snowflake][errors]") {
  const std::int64_t last_valid =
      SnowflakeGenerator::kEpochUnixMillis + SnowflakeGenerator::kMaxTimestamp;
  core::ManualClock clock(at(last_valid));
  SnowflakeGenerator gen(1023, clock);

  const auto parts = SnowflakeGenerator::decompose(gen.generate());
  CHECK(parts.timestamp_ms == SnowflakeGenerator::kMaxTimestamp);

  clock.set(at(last_valid + 1));
  CHECK_THROWS_AS(gen.generate(), core::ClockOutOfRangeError);
}
