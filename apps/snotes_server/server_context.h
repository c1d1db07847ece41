#pragma once

#include "snotes/core/clock.h"
#include "snotes/storage/paste_storage.h"

#include "config.h"

namespace snotes::server {

// ServerContext holds all process-lifetime references passed to every method handler.
// All references must remain valid for the lifetime of run_server_loop().
struct ServerContext {
  snotes::storage::IPasteStorage& storage;  // NOLINT(readability-identifier-naming)
  core::IClock& clock;              // NOLINT(readability-identifier-naming)
  const ServerConfig& config;       // NOLINT(readability-identifier-naming)
};

}  // namespace snotes::server
