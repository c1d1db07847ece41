#pragma once

#include "snotes/core/result.h"

#include <nlohmann/json.hpp>

#include "jsonrpc_protocol.h"
#include "server_context.h"
#include <functional>
#include <string>
#include <unordered_map>

namespace snotes::server {

// A handler receives the request params and returns either the "result" member or the
// "error" member of the response. Storage exceptions are left to the server loop.
using MethodHandler =
    std::function<core::Result<nlohmann::json, JsonRpcError>(const nlohmann::json& params,
                                                              ServerContext& ctx)>;

using MethodRegistry = std::unordered_map<std::string, MethodHandler>;

MethodRegistry build_method_registry();

}  // namespace snotes::server
