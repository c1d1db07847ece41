#pragma once

#include "snotes/core/ids.h"
#include "snotes/domain/paste.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace snotes::storage {

// IPasteStorage is the contract every paste backend implements.
//
// Each backend owns one token::ITokenGenerator for its whole lifetime and reads time
// from an injected core::IClock. No input validation happens here: content length and
// TTL bounds belong to the request layer (snotes::app).
//
// Errors propagate to the caller; nothing is retried or swallowed inside a backend:
// - core::TokenCollisionError: a freshly minted token already exists (deployment error)
// - core::ClockRegressionError / core::ClockOutOfRangeError: from the token generator
// - core::PersistenceFailureError: durable backend only
class IPasteStorage {
 public:
  virtual ~IPasteStorage() = default;

  // Mint a token, stamp created_at = now and expires_at = now + ttl_seconds, persist,
  // and return the stored record. ttl_seconds must be non-negative and now + ttl_seconds must
  // fit a millisecond timestamp; otherwise std::out_of_range is thrown and nothing is stored.
  virtual domain::StoredPaste create(const std::string& content, std::int64_t ttl_seconds,
                                     const std::string& content_type) = 0;

  // Exact token lookup. Returns std::nullopt when the token is unknown or the paste has
  // expired (now >= expires_at). Non-const: a backend may evict on read.
  [[nodiscard]] virtual std::optional<domain::StoredPaste> get(const core::PasteToken& token) = 0;

  // Delete every record with expires_at <= now; returns how many were removed.
  virtual std::size_t cleanup_expired() = 0;

  // "memory" or "sqlite"; used in startup diagnostics and health output.
  [[nodiscard]] virtual std::string_view backend_name() const = 0;

 protected:
  IPasteStorage() = default;
  IPasteStorage(const IPasteStorage&) = default;
  IPasteStorage& operator=(const IPasteStorage&) = default;
  IPasteStorage(IPasteStorage&&) = default;
  IPasteStorage& operator=(IPasteStorage&&) = default;
};

}  // namespace snotes::storage
