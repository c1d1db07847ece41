#pragma once

#include "method_handlers.h"
#include "server_context.h"
#include <iosfwd>
#include <string>

namespace snotes::server {

// handle_line turns one request line into exactly one response line (without the
// trailing newline). Exceptions raised by handlers are mapped here:
// - core::SnotesError  -> kInternalError, data.kind = error kind
// - nlohmann json type errors -> kInvalidParams
// - other std::exception -> kInternalError
// Every failure is logged to log.
std::string handle_line(const std::string& line, const MethodRegistry& registry,
                        ServerContext& ctx, std::ostream& log);

// run_server_loop reads newline-delimited requests from in until EOF, writing responses to
// out. Blank lines are skipped.
void run_server_loop(ServerContext& ctx, std::istream& in, std::ostream& out, std::ostream& log);

}  // namespace snotes::server
