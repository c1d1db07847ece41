#include "get_paste.h"

#include "snotes/app/paste_service.h"
#include "snotes/domain/paste.h"

#include <optional>
#include <string>
#include <utility>

namespace snotes::server::handlers {

using json = nlohmann::json;

namespace {

std::optional<std::string> token_param(const json& params) {
  if (!params.is_object() || !params.contains("token") || !params["token"].is_string()) {
    return std::nullopt;
  }
  return params["token"].get<std::string>();
}

}  // namespace

HandlerResult handle_get_paste(const json& params, ServerContext& ctx) {
  const auto token = token_param(params);
  if (!token.has_value()) {
    return invalid_param("token", "token is required and must be a string");
  }

  auto paste = app::fetch_paste(token.value(), ctx.storage);
  if (!paste.has_value()) {
    return HandlerResult::err(to_jsonrpc_error(paste.error()));
  }
  return HandlerResult::ok(domain::paste_to_json(paste.value()));
}

HandlerResult handle_get_paste_content(const json& params, ServerContext& ctx) {
  const auto token = token_param(params);
  if (!token.has_value()) {
    return invalid_param("token", "token is required and must be a string");
  }

  auto content = app::fetch_paste_content(token.value(), ctx.storage);
  if (!content.has_value()) {
    return HandlerResult::err(to_jsonrpc_error(content.error()));
  }

  const auto& view = content.value();
  json result;
  result["content"] = view.content;
  result["content_type"] = view.content_type;
  result["etag"] = view.etag;
  result["cache_control"] = view.cache_control;
  return HandlerResult::ok(std::move(result));
}

}  // namespace snotes::server::handlers
