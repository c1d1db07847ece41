#pragma once

#include <nlohmann/json.hpp>

#include "../server_context.h"
#include "request_errors.h"

namespace snotes::server::handlers {

// pastes.get          params: { "token": string }  result: metadata + content + created_at
// pastes.get_content  params: { "token": string }
//                     result: { content, content_type, etag, cache_control }
// Unknown, malformed and expired tokens all answer kPasteNotFound.
HandlerResult handle_get_paste(const nlohmann::json& params, ServerContext& ctx);
HandlerResult handle_get_paste_content(const nlohmann::json& params, ServerContext& ctx);

}  // namespace snotes::server::handlers
