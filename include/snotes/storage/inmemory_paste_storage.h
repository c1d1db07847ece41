#pragma once

#include "snotes/core/clock.h"
#include "snotes/storage/paste_storage.h"
#include "snotes/token/token_generator.h"

#include <map>
#include <memory>
#include <mutex>

namespace snotes::storage {

// InMemoryPasteStorage keeps pastes in a process-local std::map. Ephemeral: lost on exit.
//
// Expiry: get() erases an expired entry as part of the read (lazy eviction), so a later
// cleanup_expired() does not count it again.
//
// Thread-safety: one mutex guards the map. The lookup, expiry check and erase in get()
// happen under a single lock acquisition, atomic with respect to create() and
// cleanup_expired(). Token minting and hashing run outside the lock.
class InMemoryPasteStorage final : public IPasteStorage {
 public:
  // clock must outlive the storage.
  InMemoryPasteStorage(std::unique_ptr<token::ITokenGenerator> tokens, core::IClock& clock);
  ~InMemoryPasteStorage() override = default;

  // Disable copy/move (mutex not copyable)
  InMemoryPasteStorage(const InMemoryPasteStorage&) = delete;
  InMemoryPasteStorage& operator=(const InMemoryPasteStorage&) = delete;
  InMemoryPasteStorage(InMemoryPasteStorage&&) = delete;
  InMemoryPasteStorage& operator=(InMemoryPasteStorage&&) = delete;

  domain::StoredPaste create(const std::string& content, std::int64_t ttl_seconds,
                             const std::string& content_type) override;
  [[nodiscard]] std::optional<domain::StoredPaste> get(const core::PasteToken& token) override;
  std::size_t cleanup_expired() override;
  [[nodiscard]] std::string_view backend_name() const override { return "memory"; }

  // Number of entries held, including expired ones not yet evicted.
  [[nodiscard]] std::size_t entry_count() const;

 private:
  std::unique_ptr<token::ITokenGenerator> tokens_;
  core::IClock& clock_;

  mutable std::mutex mutex_;
  std::map<core::PasteToken, domain::StoredPaste> pastes_;
};

}  // namespace snotes::storage
