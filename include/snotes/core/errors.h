#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace snotes::core {

// ErrorKind names every failure the token and storage layers can raise.
// Not-found / expired is deliberately absent: it is an ordinary std::nullopt result.
enum class ErrorKind {
  kInvalidWorkerId,     // construction-time, fatal to the generator instance
  kClockRegression,     // per-call; the clock stepped backwards since the last id
  kClockOutOfRange,     // clock reads before the custom epoch or past the 41-bit range
  kTokenCollision,      // internal-consistency failure (duplicate worker id, misuse)
  kPersistenceFailure,  // durable backend error, propagated verbatim
};

[[nodiscard]] std::string_view to_string(ErrorKind kind);

// SnotesError is the base of all exceptions thrown by the library.
// Callers that need to branch on the failure inspect kind() instead of parsing what().
class SnotesError : public std::runtime_error {
 public:
  SnotesError(ErrorKind kind, const std::string& message);

  [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

 private:
  ErrorKind kind_;
};

class InvalidWorkerIdError final : public SnotesError {
 public:
  explicit InvalidWorkerIdError(int worker_id);

  [[nodiscard]] int worker_id() const noexcept { return worker_id_; }

 private:
  int worker_id_;
};

class ClockRegressionError final : public SnotesError {
 public:
  ClockRegressionError(std::int64_t last_millis, std::int64_t now_millis);

  [[nodiscard]] std::int64_t last_millis() const noexcept { return last_millis_; }
  [[nodiscard]] std::int64_t now_millis() const noexcept { return now_millis_; }

 private:
  std::int64_t last_millis_;
  std::int64_t now_millis_;
};

class ClockOutOfRangeError final : public SnotesError {
 public:
  explicit ClockOutOfRangeError(std::int64_t millis_since_epoch);
};

class TokenCollisionError final : public SnotesError {
 public:
  explicit TokenCollisionError(const std::string& token);
};

class PersistenceFailureError final : public SnotesError {
 public:
  explicit PersistenceFailureError(const std::string& message);
};

}  // namespace snotes::core
