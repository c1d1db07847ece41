#include "snotes/app/paste_service.h"

#include "snotes/core/utf8.h"
#include "snotes/token/base62.h"

#include <string>
#include <utility>

namespace snotes::app {

namespace {

RequestError validation_error(std::string field, std::string message) {
  return RequestError{RequestErrorCode::kValidation, std::move(message), std::move(field)};
}

RequestError not_found() {
  return RequestError{RequestErrorCode::kNotFound, "Paste not found or expired", ""};
}

}  // namespace

std::optional<RequestError> validate_create_request(const CreatePasteRequest& req) {
  if (req.content.size() < kMinContentBytes) {
    return validation_error("content", "content must not be empty");
  }
  if (req.content.size() > kMaxContentBytes) {
    return validation_error("content", "content exceeds " + std::to_string(kMaxContentBytes) +
                                           " bytes (got " + std::to_string(req.content.size()) +
                                           ")");
  }
  if (!core::is_valid_utf8(req.content)) {
    return validation_error("content", "content is not valid UTF-8");
  }

  if (req.expires_in_seconds.has_value()) {
    const std::int64_t ttl = req.expires_in_seconds.value();
    if (ttl < kMinExpiresInSeconds || ttl > kMaxExpiresInSeconds) {
      return validation_error("expires_in_seconds",
                              "expires_in_seconds must be between " +
                                  std::to_string(kMinExpiresInSeconds) + " and " +
                                  std::to_string(kMaxExpiresInSeconds));
    }
  }

  if (req.content_type.has_value() && req.content_type->empty()) {
    return validation_error("content_type", "content_type must not be empty");
  }

  return std::nullopt;
}

core::Result<domain::StoredPaste, RequestError> create_paste(const CreatePasteRequest& req,
                                                             storage::IPasteStorage& storage) {
  using R = core::Result<domain::StoredPaste, RequestError>;

  if (auto error = validate_create_request(req); error.has_value()) {
    return R::err(std::move(error.value()));
  }

  const std::int64_t ttl = req.expires_in_seconds.value_or(kDefaultExpiresInSeconds);
  const std::string content_type =
      req.content_type.value_or(std::string(domain::kDefaultContentType));

  return R::ok(storage.create(req.content, ttl, content_type));
}

core::Result<domain::StoredPaste, RequestError> fetch_paste(const std::string& token,
                                                            storage::IPasteStorage& storage) {
  using R = core::Result<domain::StoredPaste, RequestError>;

  if (!token::is_well_formed_token(token)) {
    return R::err(not_found());
  }

  auto paste = storage.get(core::PasteToken{token});
  if (!paste.has_value()) {
    return R::err(not_found());
  }
  return R::ok(std::move(paste.value()));
}

core::Result<PasteContent, RequestError> fetch_paste_content(const std::string& token,
                                                             storage::IPasteStorage& storage) {
  using R = core::Result<PasteContent, RequestError>;

  auto fetched = fetch_paste(token, storage);
  if (!fetched.has_value()) {
    return R::err(fetched.error());
  }

  const auto& paste = fetched.value();
  return R::ok(PasteContent{paste.content, paste.content_type, entity_tag(paste),
                            kContentCacheControl});
}

std::size_t sweep_expired(storage::IPasteStorage& storage) {
  return storage.cleanup_expired();
}

std::string entity_tag(const domain::StoredPaste& paste) {
  return "\"" + paste.sha256 + "\"";
}

}  // namespace snotes::app
