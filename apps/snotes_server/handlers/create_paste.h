#pragma once

#include <nlohmann/json.hpp>

#include "../server_context.h"
#include "request_errors.h"

namespace snotes::server::handlers {

// pastes.create
//   params: { "content": string, "expires_in_seconds"?: integer, "content_type"?: string }
//   result: paste metadata (token, expires_at, size_bytes, content_type, sha256)
HandlerResult handle_create_paste(const nlohmann::json& params, ServerContext& ctx);

}  // namespace snotes::server::handlers
