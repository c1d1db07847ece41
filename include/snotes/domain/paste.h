#pragma once

#include "snotes/core/ids.h"
#include "snotes/core/time.h"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>

namespace snotes::domain {

inline constexpr std::string_view kDefaultContentType = "text/plain; charset=utf-8";

// StoredPaste is one immutable paste record.
//
// Lifecycle: Active (now < expires_at) -> Expired (now >= expires_at, never stored as a
// status) -> Deleted (gone from storage). There is no update path; a record is created
// once and only ever deleted afterwards.
struct StoredPaste {
  core::PasteToken token;    // NOLINT(readability-identifier-naming)
  std::string content;       // UTF-8 bytes, opaque to storage
  std::string content_type;  // NOLINT(readability-identifier-naming)
  std::size_t size_bytes{0};  // byte length of content, not code points
  std::string sha256;        // lower-case hex digest of content
  core::Timestamp created_at;  // NOLINT(readability-identifier-naming)
  core::Timestamp expires_at;  // created_at + ttl

  bool operator==(const StoredPaste&) const = default;
};

// make_stored_paste fills in the derived fields (size_bytes, sha256, expires_at).
// Throws std::out_of_range when ttl is negative or created_at + ttl overflows milliseconds.
[[nodiscard]] StoredPaste make_stored_paste(core::PasteToken token, std::string content,
                                            std::string content_type, core::Timestamp created_at,
                                            std::chrono::seconds ttl);

// A paste is expired from the instant now reaches expires_at.
[[nodiscard]] inline bool is_expired(const StoredPaste& paste, const core::Timestamp now) {
  return now >= paste.expires_at;
}

// Metadata view returned after create: token, expires_at, size_bytes, content_type, sha256.
[[nodiscard]] nlohmann::json paste_metadata_to_json(const StoredPaste& paste);

// Full view: metadata plus content and created_at.
[[nodiscard]] nlohmann::json paste_to_json(const StoredPaste& paste);

}  // namespace snotes::domain
