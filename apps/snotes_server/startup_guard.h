#pragma once

#include "config.h"
#include <string>

namespace snotes::server {

// validate_server_config checks startup preconditions for the paste server.
//
// Returns: "" on success, non-empty error message on failure.
// Caller is responsible for printing the error and exiting with code 1.
//
// Preconditions checked (first failure is returned):
// - no flag was rejected during parsing
// - worker_id is within [0, 1023]
// - sqlite storage has a --db path
// - --db is not combined with --storage memory
[[nodiscard]] std::string validate_server_config(const ServerConfig& config);

}  // namespace snotes::server
