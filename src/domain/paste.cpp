#include "snotes/domain/paste.h"

#include "snotes/core/sha256.h"

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

namespace snotes::domain {

StoredPaste make_stored_paste(core::PasteToken token, std::string content,
                              std::string content_type, const core::Timestamp created_at,
                              const std::chrono::seconds ttl) {
  const std::int64_t created_ms = created_at.time_since_epoch().count();
  if (ttl.count() < 0 ||
      ttl.count() > (std::numeric_limits<std::int64_t>::max() - created_ms) / 1000) {
    throw std::out_of_range("ttl of " + std::to_string(ttl.count()) +
                            " seconds does not fit a millisecond expiry");
  }

  StoredPaste paste;
  paste.token = std::move(token);
  paste.size_bytes = content.size();
  paste.sha256 = core::sha256_hex(content);
  paste.content = std::move(content);
  paste.content_type = std::move(content_type);
  paste.created_at = created_at;
  paste.expires_at = created_at + std::chrono::duration_cast<std::chrono::milliseconds>(ttl);
  return paste;
}

nlohmann::json paste_metadata_to_json(const StoredPaste& paste) {
  nlohmann::json j;
  j["content_type"] = paste.content_type;
  j["expires_at"] = core::format_iso8601(paste.expires_at);
  j["sha256"] = paste.sha256;
  j["size_bytes"] = paste.size_bytes;
  j["token"] = paste.token.value;
  return j;
}

nlohmann::json paste_to_json(const StoredPaste& paste) {
  nlohmann::json j = paste_metadata_to_json(paste);
  j["content"] = paste.content;
  j["created_at"] = core::format_iso8601(paste.created_at);
  return j;
}

}  // namespace snotes::domain
