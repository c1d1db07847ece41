#pragma once

#include <nlohmann/json.hpp>

#include "../server_context.h"
#include "request_errors.h"

namespace snotes::server::handlers {

// health reports version, storage backend, worker id and the server's current time.
HandlerResult handle_health(const nlohmann::json& params, ServerContext& ctx);

}  // namespace snotes::server::handlers
