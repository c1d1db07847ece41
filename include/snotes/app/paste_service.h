#pragma once

#include "snotes/core/result.h"
#include "snotes/domain/paste.h"
#include "snotes/storage/paste_storage.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace snotes::app {

// ────────────────────────────────────────────────────────────────
// Request limits
// ────────────────────────────────────────────────────────────────

inline constexpr std::size_t kMinContentBytes = 1;
inline constexpr std::size_t kMaxContentBytes = 65536;
inline constexpr std::int64_t kMinExpiresInSeconds = 60;
inline constexpr std::int64_t kMaxExpiresInSeconds = 604800;  // 7 days
inline constexpr std::int64_t kDefaultExpiresInSeconds = 86400;

inline constexpr const char* kContentCacheControl = "no-store";

// ────────────────────────────────────────────────────────────────
// Request / outcome types
// ────────────────────────────────────────────────────────────────

enum class RequestErrorCode {
  kValidation,  // request rejected before reaching storage
  kNotFound,    // unknown, malformed or expired token
};

struct RequestError {
  RequestErrorCode code;  // NOLINT(readability-identifier-naming)
  std::string message;    // NOLINT(readability-identifier-naming)
  std::string field;      // offending request field; empty for kNotFound
};

struct CreatePasteRequest {
  std::string content;                            // NOLINT(readability-identifier-naming)
  std::optional<std::int64_t> expires_in_seconds;  // default kDefaultExpiresInSeconds
  std::optional<std::string> content_type;        // default domain::kDefaultContentType
};

// Raw content view with the caching decoration a transport layer should apply.
struct PasteContent {
  std::string content;        // NOLINT(readability-identifier-naming)
  std::string content_type;   // NOLINT(readability-identifier-naming)
  std::string etag;           // quoted sha256
  std::string cache_control;  // NOLINT(readability-identifier-naming)
};

// ────────────────────────────────────────────────────────────────
// Operations
// ────────────────────────────────────────────────────────────────

// validate_create_request checks content size (1..65536 bytes), UTF-8 well-formedness and
// the TTL range (60..604800 s). Returns the first violation found.
[[nodiscard]] std::optional<RequestError> validate_create_request(const CreatePasteRequest& req);

// create_paste validates, applies defaults and stores.
// Storage exceptions (persistence, collision, clock) propagate unchanged.
[[nodiscard]] core::Result<domain::StoredPaste, RequestError> create_paste(
    const CreatePasteRequest& req, storage::IPasteStorage& storage);

// fetch_paste resolves a token. Malformed tokens are reported as not found without a
// storage round-trip.
[[nodiscard]] core::Result<domain::StoredPaste, RequestError> fetch_paste(
    const std::string& token, storage::IPasteStorage& storage);

[[nodiscard]] core::Result<PasteContent, RequestError> fetch_paste_content(
    const std::string& token, storage::IPasteStorage& storage);

// sweep_expired runs the storage sweep and returns the number of removed pastes.
std::size_t sweep_expired(storage::IPasteStorage& storage);

// entity_tag is the strong validator for a paste: its sha256 in double quotes.
[[nodiscard]] std::string entity_tag(const domain::StoredPaste& paste);

}  // namespace snotes::app
