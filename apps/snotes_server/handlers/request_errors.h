#pragma once

#include "snotes/app/paste_service.h"

#include <nlohmann/json.hpp>

#include "../jsonrpc_protocol.h"
#include <string>

namespace snotes::server::handlers {

using HandlerResult = core::Result<nlohmann::json, JsonRpcError>;

inline constexpr const char* kNotFoundMessage = "Paste not found or expired";

// to_jsonrpc_error maps a paste-service rejection onto its wire error.
inline JsonRpcError to_jsonrpc_error(const app::RequestError& error) {
  switch (error.code) {
    case app::RequestErrorCode::kValidation:
      return {kInvalidParams, error.message, {{"field", error.field}}};
    case app::RequestErrorCode::kNotFound:
      return {kPasteNotFound, kNotFoundMessage, nlohmann::json::object()};
  }
  return {kInternalError, error.message, nlohmann::json::object()};
}

inline HandlerResult invalid_param(const std::string& field, const std::string& message) {
  return HandlerResult::err({kInvalidParams, message, {{"field", field}}});
}

}  // namespace snotes::server::handlers
