#pragma once

#include "snotes/core/result.h"

#include <nlohmann/json.hpp>

#include <string>

namespace snotes::server {

// JSON-RPC 2.0 message types. Ids are kept as raw JSON so a numeric id is echoed back
// as a number and a string id as a string; absent ids are null.
struct JsonRpcRequest {
  std::string jsonrpc{"2.0"};  // NOLINT(readability-identifier-naming)
  nlohmann::json id;           // NOLINT(readability-identifier-naming)
  std::string method;          // NOLINT(readability-identifier-naming)
  nlohmann::json params;       // NOLINT(readability-identifier-naming)
};

struct JsonRpcError {
  int code;             // NOLINT(readability-identifier-naming)
  std::string message;  // NOLINT(readability-identifier-naming)
  nlohmann::json data;  // NOLINT(readability-identifier-naming)
};

// Error codes (JSON-RPC 2.0 reserved range + custom)
constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;
constexpr int kPasteNotFound = -32004;

// RequestParseError carries the request id alongside a framing error so the error response
// can still echo it.
struct RequestParseError {
  nlohmann::json id;   // NOLINT(readability-identifier-naming)
  JsonRpcError error;  // NOLINT(readability-identifier-naming)
};

// parse_request decodes one line.
// Errors: kParseError for malformed JSON, kInvalidRequest for a non-object message, a
// missing/non-string method, or non-structured params.
[[nodiscard]] core::Result<JsonRpcRequest, RequestParseError> parse_request(
    const std::string& json_str);

// Create JSON-RPC success response
std::string make_response(const nlohmann::json& id, const nlohmann::json& result);

// Create JSON-RPC error response
std::string make_error_response(const nlohmann::json& id, const JsonRpcError& error);

}  // namespace snotes::server
