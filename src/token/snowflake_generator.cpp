#include "snotes/token/snowflake_generator.h"

#include "snotes/core/errors.h"

namespace snotes::token {

namespace {

int checked_worker_id(const int worker_id) {
  if (worker_id < 0 || worker_id > SnowflakeGenerator::kMaxWorkerId) {
    throw core::InvalidWorkerIdError(worker_id);
  }
  return worker_id;
}

}  // namespace

SnowflakeGenerator::SnowflakeGenerator(const int worker_id, core::IClock& clock)
    : worker_id_(checked_worker_id(worker_id)), clock_(clock) {}

std::int64_t SnowflakeGenerator::read_clock() {
  const std::int64_t now = core::to_unix_millis(clock_.now()) - kEpochUnixMillis;
  if (now < 0 || now > kMaxTimestamp) {
    throw core::ClockOutOfRangeError(now);
  }
  return now;
}

std::int64_t SnowflakeGenerator::wait_next_millis() {
  std::int64_t now = read_clock();
  while (now <= last_timestamp_) {
    if (now < last_timestamp_) {
      throw core::ClockRegressionError(last_timestamp_, now);
    }
    now = read_clock();
  }
  return now;
}

std::uint64_t SnowflakeGenerator::generate() {
  std::lock_guard<std::mutex> lock(mutex_);

  std::int64_t now = read_clock();
  if (now < last_timestamp_) {
    throw core::ClockRegressionError(last_timestamp_, now);
  }

  // Commit sequence_ and last_timestamp_ only once an id is certain to be issued, so a
  // throw from the exhaustion wait leaves the state exactly as the last success left it.
  std::uint32_t sequence = 0;
  if (now == last_timestamp_) {
    sequence = (sequence_ + 1u) & kSequenceMask;
    if (sequence == 0) {
      now = wait_next_millis();
    }
  }

  last_timestamp_ = now;
  sequence_ = sequence;

  return (static_cast<std::uint64_t>(now) << kTimestampShift) |
         (static_cast<std::uint64_t>(worker_id_) << kWorkerIdShift) |
         static_cast<std::uint64_t>(sequence);
}

SnowflakeParts SnowflakeGenerator::decompose(const std::uint64_t id) noexcept {
  SnowflakeParts parts;
  parts.timestamp_ms = static_cast<std::int64_t>(id >> kTimestampShift);
  parts.worker_id = static_cast<int>((id >> kWorkerIdShift) &
                                     static_cast<std::uint64_t>(kMaxWorkerId));
  parts.sequence = static_cast<std::uint32_t>(id & kSequenceMask);
  return parts;
}

}  // namespace snotes::token
