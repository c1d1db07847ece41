#pragma once

#include "snotes/core/clock.h"

#include <cstdint>
#include <mutex>

namespace snotes::token {

// SnowflakeParts is a generated id split back into its three fields.
struct SnowflakeParts {
  std::int64_t timestamp_ms{0};  // milliseconds since SnowflakeGenerator::kEpochUnixMillis
  int worker_id{0};              // NOLINT(readability-identifier-naming)
  std::uint32_t sequence{0};     // NOLINT(readability-identifier-naming)
};

// SnowflakeGenerator mints 64-bit, time-ordered ids for one worker.
//
// Layout, most-significant bit first:
//   [1 bit zero][41 bits ms since epoch][10 bits worker id][12 bits sequence]
//
// Capacity: 4096 ids per millisecond per worker, 1024 workers, ~69 years from the epoch.
//
// Guarantees (per instance):
// - generate() calls are linearised by one mutex; every returned value is strictly greater
//   than every value returned before it.
// - A clock that reads earlier than the last issued millisecond is refused with
//   core::ClockRegressionError. Nothing is minted and internal state is unchanged, so a
//   caller that waits for the clock to catch up can continue safely.
// - When the 4096 ids of one millisecond are exhausted, generate() busy-polls the clock
//   while still holding the mutex until the next millisecond. There is no sleep: the wait
//   is bounded by clock granularity. Sustained demand above 4096 ids/ms degrades latency
//   for every caller on the instance but never correctness.
//
// Worker id uniqueness among co-running instances is a deployment invariant; it is not
// checked here. No state survives a restart: a new instance resumes from the wall clock.
class SnowflakeGenerator {
 public:
  // 2024-01-01T00:00:00Z in Unix milliseconds.
  static constexpr std::int64_t kEpochUnixMillis = 1704067200000;

  static constexpr unsigned kTimestampBits = 41;
  static constexpr unsigned kWorkerIdBits = 10;
  static constexpr unsigned kSequenceBits = 12;

  static constexpr unsigned kWorkerIdShift = kSequenceBits;
  static constexpr unsigned kTimestampShift = kSequenceBits + kWorkerIdBits;

  static constexpr int kMaxWorkerId = (1 << kWorkerIdBits) - 1;
  static constexpr std::uint32_t kSequenceMask = (1u << kSequenceBits) - 1u;
  static constexpr std::int64_t kMaxTimestamp = (std::int64_t{1} << kTimestampBits) - 1;

  // Throws core::InvalidWorkerIdError unless 0 <= worker_id <= kMaxWorkerId.
  // clock must outlive the generator.
  SnowflakeGenerator(int worker_id, core::IClock& clock);
  ~SnowflakeGenerator() = default;

  // Not copyable or movable (owns a mutex and a position in the id stream)
  SnowflakeGenerator(const SnowflakeGenerator&) = delete;
  SnowflakeGenerator& operator=(const SnowflakeGenerator&) = delete;
  SnowflakeGenerator(SnowflakeGenerator&&) = delete;
  SnowflakeGenerator& operator=(SnowflakeGenerator&&) = delete;

  // Throws core::ClockRegressionError or core::ClockOutOfRangeError.
  [[nodiscard]] std::uint64_t generate();

  [[nodiscard]] int worker_id() const noexcept { return worker_id_; }

  [[nodiscard]] static SnowflakeParts decompose(std::uint64_t id) noexcept;

 private:
  // Current clock reading in ms since kEpochUnixMillis, range-checked.
  [[nodiscard]] std::int64_t read_clock();

  // Spin until the clock passes last_timestamp_. Caller holds mutex_.
  [[nodiscard]] std::int64_t wait_next_millis();

  const int worker_id_;
  core::IClock& clock_;

  std::mutex mutex_;
  std::int64_t last_timestamp_{-1};  // -1: nothing issued yet
  std::uint32_t sequence_{0};
};

}  // namespace snotes::token
