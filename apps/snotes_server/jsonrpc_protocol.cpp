#include "jsonrpc_protocol.h"

#include <utility>

namespace snotes::server {

using json = nlohmann::json;

namespace {

core::Result<JsonRpcRequest, RequestParseError> invalid_request(const json& id,
                                                                const std::string& message) {
  return core::Result<JsonRpcRequest, RequestParseError>::err(
      RequestParseError{id, JsonRpcError{kInvalidRequest, message, json::object()}});
}

}  // namespace

core::Result<JsonRpcRequest, RequestParseError> parse_request(const std::string& json_str) {
  json message = json::parse(json_str, nullptr, /*allow_exceptions=*/false);
  if (message.is_discarded()) {
    return core::Result<JsonRpcRequest, RequestParseError>::err(
        RequestParseError{nullptr, JsonRpcError{kParseError, "Invalid JSON", json::object()}});
  }
  if (!message.is_object()) {
    return invalid_request(nullptr, "Request must be a JSON object");
  }

  JsonRpcRequest request;
  if (message.contains("id")) {
    const auto& id = message["id"];
    if (id.is_string() || id.is_number_integer() || id.is_null()) {
      request.id = id;
    } else {
      return invalid_request(nullptr, "Request id must be a string, integer or null");
    }
  }

  if (!message.contains("method") || !message["method"].is_string()) {
    return invalid_request(request.id, "Request method must be a string");
  }
  request.method = message["method"].get<std::string>();

  if (message.contains("jsonrpc") && message["jsonrpc"].is_string()) {
    request.jsonrpc = message["jsonrpc"].get<std::string>();
  }

  request.params = message.value("params", json::object());
  if (!request.params.is_object() && !request.params.is_array()) {
    return invalid_request(request.id, "Request params must be an object or array");
  }

  return core::Result<JsonRpcRequest, RequestParseError>::ok(std::move(request));
}

std::string make_response(const json& id, const json& result) {
  json response;
  response["jsonrpc"] = "2.0";
  response["id"] = id;
  response["result"] = result;
  return response.dump();
}

std::string make_error_response(const json& id, const JsonRpcError& error) {
  json response;
  response["jsonrpc"] = "2.0";
  response["id"] = id;
  response["error"] = {
      {"code", error.code},
      {"message", error.message},
      {"data", error.data},
  };
  return response.dump();
}

}  // namespace snotes::server
