#include "create_paste.h"

#include "snotes/app/paste_service.h"
#include "snotes/domain/paste.h"

#include <cstdint>
#include <string>

namespace snotes::server::handlers {

using json = nlohmann::json;

HandlerResult handle_create_paste(const json& params, ServerContext& ctx) {
  if (!params.is_object()) {
    return invalid_param("params", "params must be an object");
  }

  app::CreatePasteRequest request;

  if (!params.contains("content") || !params["content"].is_string()) {
    return invalid_param("content", "content is required and must be a string");
  }
  request.content = params["content"].get<std::string>();

  if (params.contains("expires_in_seconds")) {
    const auto& ttl = params["expires_in_seconds"];
    if (!ttl.is_number_integer()) {
      return invalid_param("expires_in_seconds", "expires_in_seconds must be an integer");
    }
    request.expires_in_seconds = ttl.get<std::int64_t>();
  }

  if (params.contains("content_type")) {
    const auto& content_type = params["content_type"];
    if (!content_type.is_string()) {
      return invalid_param("content_type", "content_type must be a string");
    }
    request.content_type = content_type.get<std::string>();
  }

  auto created = app::create_paste(request, ctx.storage);
  if (!created.has_value()) {
    return HandlerResult::err(to_jsonrpc_error(created.error()));
  }
  return HandlerResult::ok(domain::paste_metadata_to_json(created.value()));
}

}  // namespace snotes::server::handlers
