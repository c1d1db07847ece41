#include "snotes/storage/inmemory_paste_storage.h"

#include "snotes/core/errors.h"

#include <chrono>
#include <stdexcept>
#include <utility>

namespace snotes::storage {

InMemoryPasteStorage::InMemoryPasteStorage(std::unique_ptr<token::ITokenGenerator> tokens,
                                           core::IClock& clock)
    : tokens_(std::move(tokens)), clock_(clock) {
  if (!tokens_) {
    throw std::invalid_argument("InMemoryPasteStorage requires a token generator");
  }
}

domain::StoredPaste InMemoryPasteStorage::create(const std::string& content,
                                                 const std::int64_t ttl_seconds,
                                                 const std::string& content_type) {
  auto minted = tokens_->next();
  auto paste = domain::make_stored_paste(std::move(minted.token), content, content_type,
                                         clock_.now(), std::chrono::seconds{ttl_seconds});

  std::lock_guard<std::mutex> lock(mutex_);
  if (!pastes_.try_emplace(paste.token, paste).second) {
    throw core::TokenCollisionError(paste.token.value);
  }
  return paste;
}

std::optional<domain::StoredPaste> InMemoryPasteStorage::get(const core::PasteToken& token) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = pastes_.find(token);
  if (it == pastes_.end()) {
    return std::nullopt;
  }

  if (domain::is_expired(it->second, clock_.now())) {
    pastes_.erase(it);
    return std::nullopt;
  }

  return it->second;
}

std::size_t InMemoryPasteStorage::cleanup_expired() {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto now = clock_.now();
  return std::erase_if(pastes_,
                       [now](const auto& entry) { return domain::is_expired(entry.second, now); });
}

std::size_t InMemoryPasteStorage::entry_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pastes_.size();
}

}  // namespace snotes::storage
