#pragma once

#include "snotes/app/paste_service.h"
#include "snotes/storage/paste_storage.h"

#include <optional>
#include <ostream>
#include <string>

// execute_put: store one paste and print its metadata JSON.
// execute_get: print the full paste JSON, or report not found and return 1.
// execute_sweep: remove expired pastes and print {"removed": N}.
// All take only interface types; storage exceptions propagate to the command.
int execute_put(const snotes::app::CreatePasteRequest& request,
                snotes::storage::IPasteStorage& storage, std::ostream& out, std::ostream& err);
int execute_get(const std::string& token, snotes::storage::IPasteStorage& storage,
                std::ostream& out, std::ostream& err);
int execute_sweep(snotes::storage::IPasteStorage& storage, std::ostream& out);

// check_put_worker_id: put mints tokens against a database a running server may share, so
// the worker id is required and must differ from every other writer's. Returns "" when
// worker_id is present and within 0..1023, otherwise the message to print.
std::string check_put_worker_id(const std::optional<int>& worker_id);
