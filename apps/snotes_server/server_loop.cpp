#include "server_loop.h"

#include "snotes/core/errors.h"

#include <nlohmann/json.hpp>

#include "jsonrpc_protocol.h"
#include <istream>
#include <ostream>
#include <string>

namespace snotes::server {

using json = nlohmann::json;

std::string handle_line(const std::string& line, const MethodRegistry& registry,
                        ServerContext& ctx, std::ostream& log) {
  auto parsed = parse_request(line);
  if (!parsed.has_value()) {
    const auto& failure = parsed.error();
    log << "Rejected request: " << failure.error.message << "\n";
    return make_error_response(failure.id, failure.error);
  }

  const auto& request = parsed.value();
  log << "Received: " << request.method << "\n";

  // Dispatch via method registry
  auto it = registry.find(request.method);
  if (it == registry.end()) {
    return make_error_response(
        request.id,
        JsonRpcError{kMethodNotFound, "Unknown method: " + request.method, json::object()});
  }

  try {
    auto outcome = it->second(request.params, ctx);
    if (!outcome.has_value()) {
      return make_error_response(request.id, outcome.error());
    }
    return make_response(request.id, outcome.value());
  } catch (const core::SnotesError& e) {
    const std::string kind(core::to_string(e.kind()));
    log << "Error in " << request.method << " [" << kind << "]: " << e.what() << "\n";
    return make_error_response(request.id,
                               JsonRpcError{kInternalError, e.what(), {{"kind", kind}}});
  } catch (const json::exception& e) {
    log << "Error in " << request.method << " [params]: " << e.what() << "\n";
    return make_error_response(request.id,
                               JsonRpcError{kInvalidParams, e.what(), json::object()});
  } catch (const std::exception& e) {
    log << "Error in " << request.method << ": " << e.what() << "\n";
    return make_error_response(request.id,
                               JsonRpcError{kInternalError, e.what(), json::object()});
  }
}

void run_server_loop(ServerContext& ctx, std::istream& in, std::ostream& out, std::ostream& log) {
  const auto registry = build_method_registry();

  // Main loop: read JSON-RPC requests from in, write responses to out
  std::string line;
  while (std::getline(in, line)) {
    if (line.empty()) {
      continue;
    }
    out << handle_line(line, registry, ctx, log) << "\n" << std::flush;
  }

  log << "Paste server shutting down\n";
}

}  // namespace snotes::server
