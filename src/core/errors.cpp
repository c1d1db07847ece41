#include "snotes/core/errors.h"

namespace snotes::core {

std::string_view to_string(const ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kInvalidWorkerId:
      return "invalid_worker_id";
    case ErrorKind::kClockRegression:
      return "clock_regression";
    case ErrorKind::kClockOutOfRange:
      return "clock_out_of_range";
    case ErrorKind::kTokenCollision:
      return "token_collision";
    case ErrorKind::kPersistenceFailure:
      return "persistence_failure";
  }
  return "unknown";  // unreachable, all enumerators covered above
}

SnotesError::SnotesError(const ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

InvalidWorkerIdError::InvalidWorkerIdError(const int worker_id)
    : SnotesError(ErrorKind::kInvalidWorkerId,
                  "worker_id must be between 0 and 1023, got " + std::to_string(worker_id)),
      worker_id_(worker_id) {}

ClockRegressionError::ClockRegressionError(const std::int64_t last_millis,
                                           const std::int64_t now_millis)
    : SnotesError(ErrorKind::kClockRegression,
                  "Clock moved backwards: last id issued at " + std::to_string(last_millis) +
                      " ms, clock now reads " + std::to_string(now_millis) +
                      " ms; refusing to generate id"),
      last_millis_(last_millis),
      now_millis_(now_millis) {}

ClockOutOfRangeError::ClockOutOfRangeError(const std::int64_t millis_since_epoch)
    : SnotesError(ErrorKind::kClockOutOfRange,
                  "Clock reading " + std::to_string(millis_since_epoch) +
                      " ms since epoch does not fit the 41-bit timestamp field") {}

TokenCollisionError::TokenCollisionError(const std::string& token)
    : SnotesError(ErrorKind::kTokenCollision,
                  "Token collision on '" + token +
                      "': generator reissued an id (duplicate worker id?)") {}

PersistenceFailureError::PersistenceFailureError(const std::string& message)
    : SnotesError(ErrorKind::kPersistenceFailure, message) {}

}  // namespace snotes::core
