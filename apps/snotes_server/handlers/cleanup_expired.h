#pragma once

#include <nlohmann/json.hpp>

#include "../server_context.h"
#include "request_errors.h"

namespace snotes::server::handlers {

// pastes.cleanup_expired  result: { "removed": integer }
HandlerResult handle_cleanup_expired(const nlohmann::json& params, ServerContext& ctx);

}  // namespace snotes::server::handlers
